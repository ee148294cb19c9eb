#include "./ident.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

using namespace semver;

namespace {

bool is_ident_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

bool is_digit(char c) noexcept { return c >= '0' && c <= '9'; }

}  // namespace

ident::ident(std::string_view str)
    : _str(str) {
    if (str.empty() || !std::ranges::all_of(str, is_ident_char)) {
        throw invalid_ident(std::string(str));
    }

    if (!std::ranges::all_of(str, is_digit)) {
        _kind = ident_kind::alphanumeric;
        return;
    }

    if (str.size() > 1 && str.front() == '0') {
        _kind = ident_kind::digits;
        return;
    }

    _kind    = ident_kind::numeric;
    auto res = std::from_chars(str.data(), str.data() + str.size(), _num);
    if (res.ec != std::errc{} || res.ptr != str.data() + str.size()) {
        // Too large to be represented
        throw invalid_ident(std::string(str));
    }
}

std::vector<ident> ident::parse_dotted_seq(const std::string_view s) {
    std::vector<ident> acc;
    std::string_view   remaining = s;
    while (true) {
        auto dot = remaining.find('.');
        auto sub = remaining.substr(0, dot);
        if (sub.empty()) {
            throw invalid_ident(std::string(s));
        }
        acc.emplace_back(sub);
        if (dot == remaining.npos) {
            break;
        }
        remaining.remove_prefix(dot + 1);
    }
    return acc;
}

order semver::compare(const ident& lhs, const ident& rhs) noexcept {
    const bool lhs_num = lhs.kind() == ident_kind::numeric;
    const bool rhs_num = rhs.kind() == ident_kind::numeric;
    if (lhs_num != rhs_num) {
        // Numeric identifiers always have lower precedence than alphanumeric ones
        return lhs_num ? order::less : order::greater;
    }
    if (lhs_num) {
        if (lhs._num == rhs._num) {
            return order::equivalent;
        }
        return lhs._num < rhs._num ? order::less : order::greater;
    }
    auto c = lhs._str.compare(rhs._str);
    if (c == 0) {
        return order::equivalent;
    }
    return c < 0 ? order::less : order::greater;
}

order semver::compare(const std::vector<ident>& lhs, const std::vector<ident>& rhs) noexcept {
    auto l_it = lhs.cbegin();
    auto r_it = rhs.cbegin();
    for (; l_it != lhs.cend() && r_it != rhs.cend(); ++l_it, ++r_it) {
        auto o = compare(*l_it, *r_it);
        if (o != order::equivalent) {
            return o;
        }
    }
    if (l_it != lhs.cend()) {
        return order::greater;
    } else if (r_it != rhs.cend()) {
        return order::less;
    }
    return order::equivalent;
}

std::string semver::join_idents(const std::vector<ident>& ids) noexcept {
    std::string acc;
    for (auto& id : ids) {
        if (!acc.empty()) {
            acc.push_back('.');
        }
        acc += id.string();
    }
    return acc;
}
