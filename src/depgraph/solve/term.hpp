#pragma once

#include <depgraph/pkg/identity.hpp>
#include <depgraph/pkg/version_range.hpp>

#include <optional>
#include <string>

namespace depgraph {

/**
 * @brief The relationship between the versions allowed by one term and those allowed by another
 */
enum class set_relation {
    /// Every version allowed by the left is allowed by the right
    subset,
    /// No version allowed by the left is allowed by the right
    disjoint,
    /// Neither of the above
    overlapping,
};

/**
 * @brief A statement about a single package: "the selected version of `package` is (or is not)
 * within `versions`".
 *
 * A negative term is also satisfied if the package is not selected at all.
 */
struct term {
    package_identity  package;
    version_range_set versions;
    bool              positive = true;

    /// The term with the same versions and opposite polarity
    term negate() const noexcept { return term{package, versions, !positive}; }

    /// Check whether this term being true implies that `other` is true
    bool satisfies(const term& other) const noexcept;

    set_relation relation(const term& other) const noexcept;

    /**
     * @brief Obtain a term that holds exactly when both this and `other` hold. Returns nullopt
     * if no version would satisfy both.
     */
    std::optional<term> intersection(const term& other) const noexcept;

    /// Equivalent to intersection(other.negate())
    std::optional<term> difference(const term& other) const noexcept;

    std::string to_string() const noexcept;

    bool operator==(const term&) const noexcept = default;
};

}  // namespace depgraph
