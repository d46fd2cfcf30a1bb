#pragma once

#include "execkit/command.hpp"
#include "execkit/directory.hpp"
#include "execkit/errors.hpp"
#include "execkit/logger.hpp"
#include "execkit/process_exec.hpp"
#include "execkit/retry.hpp"
#include "execkit/utility.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace execkit {

struct RunnerConfig {
    /// Pause between `check_assert` attempts. Replaceable so callers can observe or skip it.
    std::function<void(std::chrono::seconds)> sleep = [](std::chrono::seconds duration) {
        std::this_thread::sleep_for(duration);
    };
};

struct CheckOptions {
    size_t retries = 1;
    std::chrono::seconds pollrate{60};
    std::optional<Command> on_retry = std::nullopt; ///< Run between attempts; its outcome is ignored.
};

/** @brief Captured streams of a command that exited successfully. */
struct Output {
    std::string out;
    std::string err;
};

/**
 * @brief Runs external commands in the logical working directory of the
 * calling thread, with debug logging and retry/assertion helpers.
 *
 * Holds only references and configuration; all members are const, so one
 * runner can be shared by several threads.
 */
class CommandRunner {
public:
    CommandRunner(Logger &logger, const DirectoryContext &directory, RunnerConfig config = {});

    /**
     * @brief Runs `cmd` once and captures its exit status and output.
     *
     * The working directory is taken from the directory context at call time.
     * Any exit status, including non-zero, is a successful result.
     *
     * @return The execution result, or `LaunchFailure` if the executable could
     *         not be started or the working directory could not be determined.
     */
    Result<ExecutionResult, LaunchFailure> gather(const Command &cmd) const;

    /**
     * @brief Runs `cmd` until it exits with `SUCCESS`, at most `options.retries` times.
     *
     * Before every attempt but the first, sleeps `options.pollrate` and runs
     * `options.on_retry` if set. A launch failure of `cmd` aborts immediately.
     *
     * @return The streams of the successful attempt, or an `AssertionFailure`
     *         describing the last attempt, or a `LaunchFailure`.
     */
    Result<Output, CheckError> check_assert(const Command &cmd, const CheckOptions &options = {}) const;

    /** @brief Same as the free `execkit::retry`. */
    template <typename Task, typename Check = truthy_fn, typename Wait = no_wait>
    auto retry(size_t retries, Task &&task, Check &&check = {}, Wait &&wait = {}) const {
        return execkit::retry(
            retries, std::forward<Task>(task), std::forward<Check>(check), std::forward<Wait>(wait));
    }

private:
    void remediate(const Command &on_retry) const;

    Logger &logger;
    const DirectoryContext &directory;
    RunnerConfig config;
};

} // namespace execkit
