#pragma once

#include "execkit/utility.hpp"

#include <cstddef>
#include <filesystem>
#include <shared_mutex>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <vector>

namespace execkit {

/**
 * @brief Tracks a logical working directory per thread.
 *
 * Each thread may push directory overrides onto its own stack. `getcwd()`
 * reports the innermost override of the calling thread, or the process's
 * current directory when the thread has none. The process's current directory
 * is never changed, so child processes can be started in a thread's logical
 * directory without affecting other threads.
 */
class DirectoryContext {
public:
    /**
     * @brief RAII guard for one pushed override. Removes it on destruction.
     *
     * Scopes may end in any order. Ending an outer scope while an inner one is
     * alive removes only the outer entry, and the inner override stays active.
     */
    class Scope {
    public:
        Scope(Scope &&other) noexcept;
        Scope(const Scope &) = delete;
        Scope &operator=(const Scope &) = delete;
        Scope &operator=(Scope &&) = delete;
        ~Scope();

        /** @brief Pops the override now instead of at destruction. */
        void release() noexcept;

        const std::filesystem::path &path() const {
            return path_;
        }

    private:
        friend class DirectoryContext;
        Scope(DirectoryContext &context, std::filesystem::path path, size_t id);

        DirectoryContext *context_;
        std::filesystem::path path_;
        std::thread::id owner_;
        size_t id_;
    };

    /**
     * @brief The calling thread's logical working directory.
     *
     * @return The innermost override, or the process's current directory, or
     *         the OS error when the latter cannot be determined (e.g. it was removed).
     */
    Result<std::filesystem::path, std::error_code> getcwd() const;

    /**
     * @brief Makes `dir` the calling thread's working directory until the
     * returned scope ends.
     *
     * Relative paths resolve against the current `getcwd()`.
     *
     * @param dir The directory to enter.
     * @return The scope guard, or an error if `dir` is not an existing directory
     *         or a relative `dir` has no current directory to resolve against.
     */
    [[nodiscard]] Result<Scope> push(const std::filesystem::path &dir);

    /** @brief Number of overrides the calling thread currently has. */
    size_t depth() const;

private:
    struct Override {
        size_t id;
        std::filesystem::path dir;
    };

    void pop(std::thread::id owner, size_t id) noexcept;

    mutable std::shared_mutex mtx_;
    std::unordered_map<std::thread::id, std::vector<Override>> stacks_;
    size_t next_id_ = 0;
};

} // namespace execkit
