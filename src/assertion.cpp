#include "execkit/assertion.hpp"

#include <format>

namespace execkit {

Result<void, AssertionFailure> assert_success(int status, AssertionFailure failure) {
    if (status == SUCCESS)
        return {};
    failure.status = status;
    return std::unexpected(std::move(failure));
}

Result<void> assert_success(int status, std::string_view message) {
    if (status == SUCCESS)
        return {};
    return std::unexpected(std::format("{} (exit status {})", message, status));
}

} // namespace execkit
