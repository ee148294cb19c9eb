#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace depgraph {

/// The value of the named environment variable, or `nullopt` if it is not set
std::optional<std::string> env_string(const std::string& name) noexcept;

/// Whether the named variable is set to a truthy string
bool env_flag(const std::string& name) noexcept;

/**
 * @brief Read a positive integer from the environment.
 *
 * Returns `nullopt` if the variable is unset. A value that is not a positive decimal integer is
 * reported with a warning and treated as if the variable were unset.
 */
std::optional<int> env_positive_int(const std::string& name) noexcept;

/// Matches "1", "true", "on" and "yes", ignoring case
bool is_truthy_string(std::string_view s) noexcept;

}  // namespace depgraph
