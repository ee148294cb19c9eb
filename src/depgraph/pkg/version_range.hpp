#pragma once

#include <semver/version.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

/**
 * @brief The low end of a version interval. An empty `version` means the interval is unbounded
 * below.
 */
struct lower_bound {
    std::optional<semver::version> version;
    bool                           inclusive = true;

    bool unbounded() const noexcept { return !version.has_value(); }
};

/**
 * @brief The high end of a version interval. An empty `version` means the interval is unbounded
 * above.
 */
struct upper_bound {
    std::optional<semver::version> version;
    bool                           inclusive = false;

    bool unbounded() const noexcept { return !version.has_value(); }
};

struct version_interval {
    depgraph::lower_bound low;
    depgraph::upper_bound high;

    bool contains(const semver::version& v) const noexcept;
    bool empty() const noexcept;

    std::string to_string() const noexcept;
};

/**
 * @brief A set of versions, stored as a sorted list of disjoint, non-adjacent intervals.
 *
 * Every operation returns a normalized set, so two sets containing the same versions always
 * compare equal.
 */
class version_range_set {
    std::vector<version_interval> _intervals;

    void _normalize() noexcept;

public:
    /// Construct an empty set (allowing no versions)
    version_range_set() = default;

    explicit version_range_set(std::vector<version_interval> ivs) noexcept;

    /// A set containing every version
    [[nodiscard]] static version_range_set any() noexcept;
    /// A set containing no versions
    [[nodiscard]] static version_range_set none() noexcept { return {}; }
    /// A set containing exactly `v`
    [[nodiscard]] static version_range_set exactly(const semver::version& v) noexcept;
    /// The half-open interval [low, high)
    [[nodiscard]] static version_range_set between(const semver::version& low,
                                                   const semver::version& high) noexcept;
    /// The interval [low, +inf)
    [[nodiscard]] static version_range_set at_least(const semver::version& low) noexcept;
    /// [v, next major), the usual "compatible with" range
    [[nodiscard]] static version_range_set up_to_next_major(const semver::version& v) noexcept;
    /// [v, next minor)
    [[nodiscard]] static version_range_set up_to_next_minor(const semver::version& v) noexcept;

    /**
     * @brief Parse a range in interval notation, e.g. "[1.0.0,2.0.0)" or "(1.2.0,]". An empty
     * bound is unbounded. Throws e_human_message if the string is malformed.
     */
    [[nodiscard]] static version_range_set parse_interval(std::string_view);

    bool empty() const noexcept { return _intervals.empty(); }
    bool is_any() const noexcept;

    bool contains(const semver::version& v) const noexcept;
    /// Check whether every version in `other` is also within this set
    bool contains(const version_range_set& other) const noexcept;
    bool disjoint(const version_range_set& other) const noexcept;
    bool intersects(const version_range_set& other) const noexcept { return !disjoint(other); }

    /// If this set holds exactly one version, return it
    std::optional<semver::version> sole_version() const noexcept;

    [[nodiscard]] version_range_set intersection(const version_range_set& other) const noexcept;
    [[nodiscard]] version_range_set union_(const version_range_set& other) const noexcept;
    [[nodiscard]] version_range_set difference(const version_range_set& other) const noexcept;
    [[nodiscard]] version_range_set complement() const noexcept;

    const std::vector<version_interval>& intervals() const noexcept { return _intervals; }

    std::string to_string() const noexcept;

    friend bool operator==(const version_range_set& lhs, const version_range_set& rhs) noexcept;
};

bool operator==(const version_range_set& lhs, const version_range_set& rhs) noexcept;

}  // namespace depgraph
