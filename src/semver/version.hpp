#pragma once

#include <semver/ident.hpp>

#include <compare>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace semver {

class invalid_version : public std::runtime_error {
    std::string    _string;
    std::ptrdiff_t _offset = 0;

public:
    invalid_version(std::string string, std::ptrdiff_t n)
        : runtime_error("Invalid semantic version: " + string)
        , _string(string)
        , _offset(n) {}

    auto& string() const noexcept { return _string; }
    auto  offset() const noexcept { return _offset; }
};

struct version;
order compare(const version& lhs, const version& rhs) noexcept;

struct version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    /// Empty for a release version
    std::vector<ident> prerelease = {};
    /// Ignored by every comparison
    std::vector<ident> build_metadata = {};

    /**
     * @brief Parse a strict semantic version string, e.g. "1.2.3-beta.1+abc"
     */
    static version parse(std::string_view s);

    /**
     * @brief Parse a version from a repository tag name.
     *
     * Tags are commonly spelled "v1.2.3" or "1.2", so a leading 'v' is dropped and a missing
     * minor or patch component is treated as zero.
     */
    static version parse_tag(std::string_view s);

    std::string to_string() const noexcept;
    bool        is_prerelease() const noexcept { return !prerelease.empty(); }

    /// The first version of the next major release (X+1.0.0)
    version next_major() const noexcept { return version{major + 1, 0, 0}; }
    /// The first version of the next minor release (X.Y+1.0)
    version next_minor() const noexcept { return version{major, minor + 1, 0}; }
    /// The first version of the next patch release (X.Y.Z+1)
    version next_patch() const noexcept { return version{major, minor, patch + 1}; }

    /// Equality by precedence. Build metadata is ignored.
    friend bool operator==(const version& lhs, const version& rhs) noexcept {
        return compare(lhs, rhs) == order::equivalent;
    }

    friend std::weak_ordering operator<=>(const version& lhs, const version& rhs) noexcept {
        switch (compare(lhs, rhs)) {
        case order::less:
            return std::weak_ordering::less;
        case order::equivalent:
            return std::weak_ordering::equivalent;
        case order::greater:
            return std::weak_ordering::greater;
        }
        return std::weak_ordering::equivalent;
    }

    friend inline std::string to_string(const version& ver) noexcept { return ver.to_string(); }
};

}  // namespace semver
