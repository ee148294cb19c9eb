#include "./version.hpp"

#include <charconv>
#include <limits>
#include <tuple>

using namespace semver;

namespace {

/**
 * Parse one numeric component at the head of `tail`. Leading zeros are rejected for
 * strict parsing. The largest `int` is rejected so that the next release is representable.
 */
bool parse_component(std::string_view& tail, int& out, bool strict) noexcept {
    if (tail.empty() || tail[0] < '0' || tail[0] > '9') {
        return false;
    }
    if (strict && tail.size() > 1 && tail[0] == '0' && tail[1] >= '0' && tail[1] <= '9') {
        return false;
    }
    auto res = std::from_chars(tail.data(), tail.data() + tail.size(), out);
    if (res.ec != std::errc{} || out < 0 || out == std::numeric_limits<int>::max()) {
        return false;
    }
    tail.remove_prefix(static_cast<std::size_t>(res.ptr - tail.data()));
    return true;
}

version parse_impl(const std::string_view str, bool lenient) {
    version          ret;
    std::string_view tail = str;
    auto             fail = [&] {
        auto offset = static_cast<std::ptrdiff_t>(str.size() - tail.size());
        return invalid_version(std::string(str), offset);
    };

    if (lenient && !tail.empty() && (tail[0] == 'v' || tail[0] == 'V')) {
        tail.remove_prefix(1);
    }

    int* const parts[] = {&ret.major, &ret.minor, &ret.patch};
    for (int idx = 0; idx < 3; ++idx) {
        if (!parse_component(tail, *parts[idx], !lenient)) {
            throw fail();
        }
        if (idx == 2) {
            break;
        }
        if (!tail.empty() && tail[0] == '.') {
            tail.remove_prefix(1);
            continue;
        }
        if (lenient && (tail.empty() || tail[0] == '-' || tail[0] == '+')) {
            // "1" or "1.2": The remaining components are zero
            break;
        }
        throw fail();
    }

    if (!tail.empty() && tail[0] == '-') {
        tail.remove_prefix(1);
        auto pre = tail.substr(0, tail.find('+'));
        try {
            ret.prerelease = ident::parse_dotted_seq(pre);
        } catch (const invalid_ident&) {
            throw fail();
        }
        for (auto& id : ret.prerelease) {
            if (id.kind() == ident_kind::digits) {
                throw fail();
            }
        }
        tail.remove_prefix(pre.size());
    }

    if (!tail.empty() && tail[0] == '+') {
        tail.remove_prefix(1);
        try {
            ret.build_metadata = ident::parse_dotted_seq(tail);
        } catch (const invalid_ident&) {
            throw fail();
        }
        tail = {};
    }

    if (!tail.empty()) {
        throw fail();
    }
    return ret;
}

}  // namespace

version version::parse(std::string_view s) { return parse_impl(s, false); }
version version::parse_tag(std::string_view s) { return parse_impl(s, true); }

std::string version::to_string() const noexcept {
    auto ret = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!prerelease.empty()) {
        ret += "-" + join_idents(prerelease);
    }
    if (!build_metadata.empty()) {
        ret += "+" + join_idents(build_metadata);
    }
    return ret;
}

order semver::compare(const version& lhs, const version& rhs) noexcept {
    auto lhs_tup = std::tie(lhs.major, lhs.minor, lhs.patch);
    auto rhs_tup = std::tie(rhs.major, rhs.minor, rhs.patch);
    if (lhs_tup < rhs_tup) {
        return order::less;
    } else if (lhs_tup > rhs_tup) {
        return order::greater;
    }
    if (lhs.is_prerelease() != rhs.is_prerelease()) {
        // A prerelease precedes its associated release
        return lhs.is_prerelease() ? order::less : order::greater;
    }
    return compare(lhs.prerelease, rhs.prerelease);
}
