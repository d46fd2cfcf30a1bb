#include "execkit/runner.hpp"

#include "execkit/assertion.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace execkit {

CommandRunner::CommandRunner(Logger &logger, const DirectoryContext &directory, RunnerConfig config)
    : logger(logger), directory(directory), config(std::move(config)) {
}

Result<ExecutionResult, LaunchFailure> CommandRunner::gather(const Command &cmd) const {
    auto cwd = directory.getcwd();
    if (!cwd) {
        logger.debug("Executing:gather [cwd=?]: {}: no working directory: {}", cmd, cwd.error().message());
        return std::unexpected(LaunchFailure{.args = cmd.args(), .working_dir = {}, .error = cwd.error()});
    }
    const std::string cmd_info = std::format("[cwd={}]: {}", cwd->string(), cmd);

    logger.debug("Executing:gather {}", cmd_info);
    auto res = process_exec(cmd.args(), *cwd);
    if (!res) {
        logger.debug("Process {}: failed to launch: {}", cmd_info, res.error().error.message());
        return res;
    }

    logger.debug("Process {}: exited with: {}\nstdout>>{}<<\nstderr>>{}<<\n", cmd_info, res->status, res->out, res->err);
    return res;
}

void CommandRunner::remediate(const Command &on_retry) const {
    auto res = gather(on_retry);
    if (!res) {
        logger.debug("assert: on_retry command could not be started, continuing: {}", res.error().message());
    } else if (!res->succeeded()) {
        logger.debug("assert: on_retry command exited with {}, continuing: {}", res->status, on_retry);
    }
}

Result<Output, CheckError> CommandRunner::check_assert(const Command &cmd, const CheckOptions &options) const {
    // A status is needed to assert on, so at least one attempt always runs.
    const size_t retries = std::max<size_t>(options.retries, 1);

    ExecutionResult last;
    size_t attempts = 0;
    for (size_t try_num = 0; try_num < retries; ++try_num) {
        if (try_num > 0) {
            logger.debug("assert: Failed {} times. Retrying in {} seconds: {}", try_num, options.pollrate.count(), cmd);
            config.sleep(options.pollrate);
            if (options.on_retry)
                remediate(*options.on_retry);
        }

        auto res = gather(cmd);
        if (!res)
            return std::unexpected(CheckError{std::move(res.error())});

        last = std::move(*res);
        ++attempts;
        if (last.status == SUCCESS)
            break;
    }

    logger.debug("assert: Final result = {} in {} tries.", last.status, attempts);

    auto checked = assert_success(last.status,
                                  AssertionFailure{.working_dir = directory.getcwd().value_or(std::filesystem::path{}),
                                                   .args = cmd.args(),
                                                   .status = last.status,
                                                   .stderr_output = last.err,
                                                   .attempts = attempts});
    if (!checked)
        return std::unexpected(CheckError{std::move(checked.error())});

    return Output{std::move(last.out), std::move(last.err)};
}

} // namespace execkit
