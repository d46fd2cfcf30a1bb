#include "execkit/errors.hpp"

#include "execkit/command.hpp"

#include <format>

namespace execkit {

std::string LaunchFailure::message() const {
    return std::format("Failed to launch [{}] {}: {}", working_dir.string(), join_args(args), error.message());
}

std::string AssertionFailure::message() const {
    return std::format("Error running [{}] {}: exited with {} after {} attempt(s).\n{}",
                       working_dir.string(),
                       join_args(args),
                       status,
                       attempts,
                       stderr_output);
}

std::string RetryExhausted::message() const {
    return std::format("Giving up after {} failed attempt(s)", attempts);
}

std::string describe(const CheckError &error) {
    return std::visit([](const auto &e) { return e.message(); }, error);
}

} // namespace execkit
