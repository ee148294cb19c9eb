#include "./log.hpp"

#include <magic_enum.hpp>
#include <neo/assert.hpp>
#include <spdlog/spdlog.h>

using namespace depgraph;

namespace {

spdlog::level::level_enum to_spdlog(log::level l) noexcept {
    switch (l) {
    case log::level::trace:
        return spdlog::level::trace;
    case log::level::debug:
        return spdlog::level::debug;
    case log::level::info:
        return spdlog::level::info;
    case log::level::warn:
        return spdlog::level::warn;
    case log::level::error:
        return spdlog::level::err;
    case log::level::critical:
        return spdlog::level::critical;
    case log::level::silent:
        return spdlog::level::off;
    }
    neo_assert_always(invariant, false, "Invalid log level", int(l));
}

spdlog::logger& logger() noexcept {
    // Filtering happens against current_log_level, so spdlog passes everything through
    static spdlog::logger& inst = []() -> spdlog::logger& {
        auto ptr = spdlog::default_logger_raw();
        ptr->set_level(spdlog::level::trace);
        return *ptr;
    }();
    return inst;
}

}  // namespace

void log::init_logger() noexcept { spdlog::set_pattern("[%^%-5l%$] %v"); }

std::optional<log::level> log::level_from_string(std::string_view str) noexcept {
    auto lvl = magic_enum::enum_cast<level>(str);
    if (!lvl) {
        return std::nullopt;
    }
    return *lvl;
}

void log::emit(level l, std::string_view message) noexcept {
    if (l == level::silent) {
        return;
    }
    logger().log(to_spdlog(l), "{}", message);
}
