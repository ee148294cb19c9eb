#include "./partial_solution.hpp"

#include <neo/assert.hpp>
#include <neo/utility.hpp>

#include <set>

using namespace depgraph;

void partial_solution::_register(const assignment& a) noexcept {
    auto found = _accumulated.find(a.term.package);
    if (found == _accumulated.end()) {
        _accumulated.emplace(a.term.package, a.term);
        return;
    }
    auto isect = found->second.intersection(a.term);
    neo_assert(invariant,
               isect.has_value(),
               "An assignment contradicts the partial solution",
               found->second.to_string(),
               a.term.to_string());
    found->second = std::move(*isect);
}

void partial_solution::decide(const package_identity& pkg, const semver::version& ver) noexcept {
    _decisions.insert_or_assign(pkg, ver);
    _assignments.push_back(assignment{
        .term           = term{pkg, version_range_set::exactly(ver), true},
        .decision_level = decision_level(),
        .index          = _assignments.size(),
        .cause          = std::nullopt,
    });
    _register(_assignments.back());
}

void partial_solution::derive(term t, incompatibility_id cause) noexcept {
    _assignments.push_back(assignment{
        .term           = std::move(t),
        .decision_level = decision_level(),
        .index          = _assignments.size(),
        .cause          = cause,
    });
    _register(_assignments.back());
}

void partial_solution::backtrack(int level) noexcept {
    std::set<package_identity> touched;
    while (!_assignments.empty() && _assignments.back().decision_level > level) {
        auto& removed = _assignments.back();
        touched.insert(removed.term.package);
        if (removed.is_decision()) {
            _decisions.erase(removed.term.package);
        }
        _assignments.pop_back();
    }
    for (auto& pkg : touched) {
        _accumulated.erase(pkg);
    }
    for (auto& a : _assignments) {
        if (touched.contains(a.term.package)) {
            _register(a);
        }
    }
}

set_relation partial_solution::relation(const term& t) const noexcept {
    auto found = _accumulated.find(t.package);
    if (found == _accumulated.end()) {
        return set_relation::overlapping;
    }
    return found->second.relation(t);
}

const assignment& partial_solution::satisfier(const term& t) const noexcept {
    std::optional<term> assigned;
    for (auto& a : _assignments) {
        if (a.term.package != t.package) {
            continue;
        }
        assigned = assigned ? assigned->intersection(a.term) : a.term;
        neo_assert(invariant,
                   assigned.has_value(),
                   "Assignments of a package have an empty intersection",
                   t.to_string());
        if (assigned->satisfies(t)) {
            return a;
        }
    }
    neo_assert_always(invariant,
                      false,
                      "Requested the satisfier of a term that is not satisfied",
                      t.to_string());
    neo::unreachable();
}

std::vector<term> partial_solution::undecided() const noexcept {
    std::vector<term> ret;
    for (auto& [pkg, t] : _accumulated) {
        if (t.positive && !_decisions.contains(pkg)) {
            ret.push_back(t);
        }
    }
    return ret;
}
