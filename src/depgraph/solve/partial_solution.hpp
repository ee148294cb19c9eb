#pragma once

#include "./incompatibility.hpp"
#include "./term.hpp"

#include <semver/version.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace depgraph {

/**
 * @brief A single entry in the partial solution's log: either a decision (selecting a version)
 * or a derivation forced by an incompatibility.
 */
struct assignment {
    depgraph::term term;
    /// The number of decisions that had been made when this assignment was made
    int         decision_level;
    std::size_t index;
    /// The incompatibility that forced this derivation. Empty for decisions.
    std::optional<incompatibility_id> cause;

    bool is_decision() const noexcept { return !cause.has_value(); }
};

/**
 * @brief The current state of the search: an append-only log of assignments, truncated when
 * backtracking.
 */
class partial_solution {
    std::vector<assignment>                     _assignments;
    std::map<package_identity, semver::version> _decisions;
    /// The intersection of all assignments of each package
    std::map<package_identity, term> _accumulated;

    void _register(const assignment&) noexcept;

public:
    int decision_level() const noexcept { return static_cast<int>(_decisions.size()); }

    const auto& decisions() const noexcept { return _decisions; }
    const auto& assignments() const noexcept { return _assignments; }

    /// Select the given version of the package, beginning a new decision level
    void decide(const package_identity&, const semver::version&) noexcept;

    /// Record a term forced by the given incompatibility at the current decision level
    void derive(term, incompatibility_id cause) noexcept;

    /// Remove every assignment made above the given decision level
    void backtrack(int level) noexcept;

    /// The relation between the current assignments and the given term
    set_relation relation(const term&) const noexcept;
    bool satisfies(const term& t) const noexcept { return relation(t) == set_relation::subset; }

    /**
     * @brief Find the earliest assignment at which the log satisfies the given term.
     *
     * The term must currently be satisfied.
     */
    const assignment& satisfier(const term&) const noexcept;

    /**
     * @brief Obtain the positive terms of packages that have not yet been decided, ordered by
     * package identity
     */
    std::vector<term> undecided() const noexcept;
};

}  // namespace depgraph
