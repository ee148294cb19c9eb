#pragma once

#include <semver/order.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

class invalid_ident : public std::runtime_error {
    std::string _str;

public:
    explicit invalid_ident(std::string s)
        : std::runtime_error("Invalid version identifier: " + s)
        , _str(std::move(s)) {}

    auto& string() const noexcept { return _str; }
};

enum class ident_kind {
    /// Contains at least one letter or hyphen
    alphanumeric,
    /// All digits, no leading zero
    numeric,
    /// All digits with a leading zero. Only legal in build metadata.
    digits,
};

class ident;
order compare(const ident& lhs, const ident& rhs) noexcept;

/**
 * @brief A single dot-separated identifier of a prerelease tag or build metadata string.
 */
class ident {
    std::string   _str;
    ident_kind    _kind;
    std::uint64_t _num = 0;

public:
    explicit ident(std::string_view str);

    auto        kind() const noexcept { return _kind; }
    const auto& string() const noexcept { return _str; }
    /// The integral value of a numeric identifier. Zero for other kinds.
    auto numeric_value() const noexcept { return _num; }

    friend order compare(const ident& lhs, const ident& rhs) noexcept;

    friend bool operator==(const ident& lhs, const ident& rhs) noexcept {
        return lhs._str == rhs._str;
    }
    friend bool operator<(const ident& lhs, const ident& rhs) noexcept {
        return compare(lhs, rhs) == order::less;
    }

    /**
     * @brief Parse a non-empty dot-separated sequence of identifiers, such as "alpha.2"
     */
    static std::vector<ident> parse_dotted_seq(std::string_view s);
};

/**
 * @brief Compare two identifier sequences with semver prerelease precedence rules.
 */
order compare(const std::vector<ident>& lhs, const std::vector<ident>& rhs) noexcept;

std::string join_idents(const std::vector<ident>&) noexcept;

}  // namespace semver
