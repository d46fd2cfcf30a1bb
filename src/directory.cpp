#include "execkit/directory.hpp"

#include <algorithm>
#include <format>
#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <system_error>

namespace execkit {

DirectoryContext::Scope::Scope(DirectoryContext &context, std::filesystem::path path, size_t id)
    : context_(&context), path_(std::move(path)), owner_(std::this_thread::get_id()), id_(id) {
}

DirectoryContext::Scope::Scope(Scope &&other) noexcept
    : context_(other.context_), path_(std::move(other.path_)), owner_(other.owner_), id_(other.id_) {
    other.context_ = nullptr;
}

DirectoryContext::Scope::~Scope() {
    release();
}

void DirectoryContext::Scope::release() noexcept {
    if (context_ != nullptr) {
        context_->pop(owner_, id_);
        context_ = nullptr;
    }
}

Result<std::filesystem::path, std::error_code> DirectoryContext::getcwd() const {
    {
        std::shared_lock lock(mtx_);
        if (auto it = stacks_.find(std::this_thread::get_id()); it != stacks_.end() && !it->second.empty())
            return it->second.back().dir;
    }
    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (ec)
        return std::unexpected(ec);
    return cwd;
}

Result<DirectoryContext::Scope> DirectoryContext::push(const std::filesystem::path &dir) {
    std::filesystem::path resolved = dir;
    if (!dir.is_absolute()) {
        auto base = getcwd();
        if (!base)
            return std::unexpected(
                std::format("Cannot resolve {}: no current directory: {}", dir.string(), base.error().message()));
        resolved = *base / dir;
    }
    resolved = resolved.lexically_normal();
    if (resolved.has_relative_path() && !resolved.has_filename())
        resolved = resolved.parent_path();

    std::error_code ec;
    if (!std::filesystem::is_directory(resolved, ec)) {
        if (ec)
            return std::unexpected(std::format("Cannot enter {}: {}", resolved.string(), ec.message()));
        return std::unexpected(std::format("Not a directory: {}", resolved.string()));
    }

    size_t id = 0;
    {
        std::unique_lock lock(mtx_);
        id = next_id_++;
        stacks_[std::this_thread::get_id()].push_back(Override{id, resolved});
    }
    return Scope{*this, std::move(resolved), id};
}

size_t DirectoryContext::depth() const {
    std::shared_lock lock(mtx_);
    if (auto it = stacks_.find(std::this_thread::get_id()); it != stacks_.end())
        return it->second.size();
    return 0;
}

void DirectoryContext::pop(std::thread::id owner, size_t id) noexcept {
    std::unique_lock lock(mtx_);
    auto it = stacks_.find(owner);
    if (it == stacks_.end())
        return;
    // Usually the innermost entry, but a scope may outlive the ones pushed after it.
    auto &stack = it->second;
    auto entry = std::find_if(stack.rbegin(), stack.rend(), [id](const Override &o) { return o.id == id; });
    if (entry != stack.rend())
        stack.erase(std::next(entry).base());
    if (stack.empty())
        stacks_.erase(it);
}

} // namespace execkit
