#include "./term.hpp"

#include <neo/assert.hpp>

using namespace depgraph;

bool term::satisfies(const term& other) const noexcept {
    return package == other.package && relation(other) == set_relation::subset;
}

set_relation term::relation(const term& other) const noexcept {
    neo_assert(expects,
               package == other.package,
               "Cannot compare terms of different packages",
               package.str(),
               other.package.str());
    if (other.positive) {
        if (positive) {
            if (other.versions.contains(versions)) {
                return set_relation::subset;
            }
            if (versions.disjoint(other.versions)) {
                return set_relation::disjoint;
            }
            return set_relation::overlapping;
        }
        // A negative term also allows the package to be absent, which no positive term allows
        if (versions.contains(other.versions)) {
            return set_relation::disjoint;
        }
        return set_relation::overlapping;
    }

    if (positive) {
        if (versions.disjoint(other.versions)) {
            return set_relation::subset;
        }
        if (other.versions.contains(versions)) {
            return set_relation::disjoint;
        }
        return set_relation::overlapping;
    }
    if (versions.contains(other.versions)) {
        return set_relation::subset;
    }
    return set_relation::overlapping;
}

std::optional<term> term::intersection(const term& other) const noexcept {
    neo_assert(expects,
               package == other.package,
               "Cannot intersect terms of different packages",
               package.str(),
               other.package.str());
    if (positive != other.positive) {
        const auto& pos = positive ? *this : other;
        const auto& neg = positive ? other : *this;
        auto        vs  = pos.versions.difference(neg.versions);
        if (vs.empty()) {
            return std::nullopt;
        }
        return term{package, std::move(vs), true};
    } else if (positive) {
        auto vs = versions.intersection(other.versions);
        if (vs.empty()) {
            return std::nullopt;
        }
        return term{package, std::move(vs), true};
    } else {
        return term{package, versions.union_(other.versions), false};
    }
}

std::optional<term> term::difference(const term& other) const noexcept {
    return intersection(other.negate());
}

std::string term::to_string() const noexcept {
    std::string ret = positive ? "" : "not ";
    ret += package.str();
    if (!versions.is_any()) {
        ret += " ";
        ret += versions.to_string();
    }
    return ret;
}
