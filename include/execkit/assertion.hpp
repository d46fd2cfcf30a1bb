#pragma once

#include "execkit/errors.hpp"
#include "execkit/utility.hpp"

#include <string_view>

namespace execkit {

/**
 * @brief Turns a non-zero status into `failure`, with its status filled in.
 * @return Nothing when `status` is `SUCCESS`, otherwise the failure.
 */
Result<void, AssertionFailure> assert_success(int status, AssertionFailure failure);

/**
 * @brief String variant for callers that only have a description.
 * @return Nothing when `status` is `SUCCESS`, otherwise `message` with the status appended.
 */
Result<void> assert_success(int status, std::string_view message);

} // namespace execkit
