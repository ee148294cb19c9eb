#include "./incompatibility.hpp"

#include <neo/assert.hpp>

#include <algorithm>

using namespace depgraph;

bool incompatibility::is_failure(const package_identity& root) const noexcept {
    return terms.empty() || (terms.size() == 1 && terms.front().package == root);
}

incompatibility_id incompatibility_store::create(std::vector<term>     terms,
                                                incompatibility_cause cause) {
    if (terms.size() != 1 && cause.is_derived()
        && std::any_of(terms.begin(), terms.end(), [&](const term& t) {
               return t.positive && t.package == _root;
           })) {
        std::erase_if(terms, [&](const term& t) { return t.positive && t.package == _root; });
    }

    const bool simple = terms.size() == 1
        || (terms.size() == 2 && terms.front().package != terms.back().package);
    if (!simple) {
        // Coalesce terms about the same package, keeping the order of first appearance
        std::vector<term> merged;
        for (auto& t : terms) {
            auto existing = std::find_if(merged.begin(), merged.end(), [&](const term& m) {
                return m.package == t.package;
            });
            if (existing == merged.end()) {
                merged.push_back(std::move(t));
                continue;
            }
            auto isect = existing->intersection(t);
            neo_assert(invariant,
                       isect.has_value(),
                       "Terms of a single package within an incompatibility have no intersection",
                       existing->to_string(),
                       t.to_string());
            *existing = std::move(*isect);
        }
        terms = std::move(merged);
    }

    _arena.push_back(incompatibility{std::move(terms), std::move(cause)});
    return _arena.size() - 1;
}

void incompatibility_store::attach(incompatibility_id id) {
    for (auto& t : (*this)[id].terms) {
        _by_package[t.package].push_back(id);
    }
}

const incompatibility& incompatibility_store::operator[](incompatibility_id id) const noexcept {
    neo_assert(expects, id < _arena.size(), "Invalid incompatibility id", id, _arena.size());
    return _arena[id];
}

std::vector<incompatibility_id>
incompatibility_store::for_package(const package_identity& pkg) const noexcept {
    auto found = _by_package.find(pkg);
    if (found == _by_package.end()) {
        return {};
    }
    return found->second;
}
