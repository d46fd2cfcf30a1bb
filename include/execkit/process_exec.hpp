#pragma once

#include "execkit/errors.hpp"
#include "execkit/utility.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace execkit {

/** @brief Outcome of one process launch. */
struct ExecutionResult {
    int status = -1;
    std::string out;
    std::string err;

    bool succeeded() const {
        return status == SUCCESS;
    }
};

/**
 * @brief Executes a subprocess and waits for it to exit.
 *
 * Standard output and standard error are captured in full; standard input is
 * inherited from the parent. A non-zero exit status is returned normally.
 *
 * @param args The command line arguments (first argument is the executable).
 * @param working_dir Working directory for the subprocess. Empty means the
 *                    parent's current directory.
 * @return The exit status and both streams, or a `LaunchFailure` if the
 *         process could not be started.
 */
Result<ExecutionResult, LaunchFailure> process_exec(const std::vector<std::string> &args,
                                                    const std::filesystem::path &working_dir);

} // namespace execkit
