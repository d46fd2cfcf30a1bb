#pragma once

#include <expected>
#include <string>

namespace execkit {

/** @brief Exit status that counts as success for an external command. */
inline constexpr int SUCCESS = 0;

template <typename T, typename E = std::string>
using Result = std::expected<T, E>;

} // namespace execkit
