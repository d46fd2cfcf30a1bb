#pragma once

#include "execkit/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace execkit {

/** @brief The executable could not be started (missing, not executable, ...). */
struct LaunchFailure {
    std::vector<std::string> args;
    std::filesystem::path working_dir;
    std::error_code error;

    std::string message() const;
};

/**
 * @brief A checked command still exited non-zero after its last attempt.
 *
 * Carries what is needed to diagnose the failure: where it ran, what ran,
 * how it exited and what it wrote to stderr.
 */
struct AssertionFailure {
    std::filesystem::path working_dir;
    std::vector<std::string> args;
    int status = SUCCESS;
    std::string stderr_output;
    size_t attempts = 0;

    std::string message() const;
};

/** @brief No attempt of a retried task satisfied its success predicate. */
struct RetryExhausted {
    size_t attempts = 0;

    std::string message() const;
};

using CheckError = std::variant<LaunchFailure, AssertionFailure>;

std::string describe(const CheckError &error);

} // namespace execkit
