#include "./env.hpp"

#include <depgraph/util/log.hpp>

#include <neo/utility.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

std::optional<std::string> depgraph::env_string(const std::string& name) noexcept {
    if (auto cptr = std::getenv(name.c_str())) {
        return std::string(cptr);
    }
    return std::nullopt;
}

bool depgraph::env_flag(const std::string& name) noexcept {
    auto s = env_string(name);
    return s && is_truthy_string(*s);
}

std::optional<int> depgraph::env_positive_int(const std::string& name) noexcept {
    auto s = env_string(name);
    if (!s) {
        return std::nullopt;
    }
    const auto end = s->data() + s->size();
    int        n   = 0;
    auto       res = std::from_chars(s->data(), end, n);
    if (res.ec != std::errc{} || res.ptr != end || n < 1) {
        depgraph_log(warn, "Ignoring invalid {} value '{}'", name, *s);
        return std::nullopt;
    }
    return n;
}

bool depgraph::is_truthy_string(std::string_view s) noexcept {
    std::string lower(s);
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lower == neo::oper::any_of("1", "true", "on", "yes");
}
