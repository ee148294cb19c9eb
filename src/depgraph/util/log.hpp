#pragma once

#include <fmt/format.h>

#include <optional>
#include <string_view>

namespace depgraph::log {

/// Severity of a message. `silent` suppresses all output.
enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

/// Messages below this level are discarded before they are formatted
inline level current_log_level = level::info;

/// Write an already-formatted message. Never throws.
void emit(level, std::string_view message) noexcept;

/// Install the message pattern on the default spdlog logger
void init_logger() noexcept;

/**
 * @brief Parse a level name ("trace", "debug", ...). Returns nullopt for unknown names.
 */
std::optional<level> level_from_string(std::string_view) noexcept;

inline bool level_enabled(level l) noexcept { return int(l) >= int(current_log_level); }

template <typename... Args>
void log(level l, std::string_view fmt_str, const Args&... args) noexcept {
    if (!level_enabled(l)) {
        return;
    }
    try {
        emit(l, fmt::format(fmt::runtime(fmt_str), args...));
    } catch (const fmt::format_error& e) {
        emit(level::error, fmt::format("Bad log format string '{}': {}", fmt_str, e.what()));
    }
}

#define depgraph_log(Level, str, ...)                                                              \
    do {                                                                                           \
        if (::depgraph::log::level_enabled(::depgraph::log::level::Level)) {                       \
            ::depgraph::log::log(::depgraph::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);   \
        }                                                                                          \
    } while (0)

}  // namespace depgraph::log
