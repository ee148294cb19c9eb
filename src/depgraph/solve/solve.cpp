#include "./solve.hpp"

#include "./explain.hpp"
#include "./incompatibility.hpp"
#include "./partial_solution.hpp"
#include "./provider_cache.hpp"

#include <depgraph/util/log.hpp>
#include <depgraph/util/signal.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <set>

using namespace depgraph;

namespace {

/// The root package takes part in solving as a package with this single version
const semver::version root_version{0, 0, 0};

struct propagate_result {
    bool                            conflict = false;
    std::optional<package_identity> derived  = std::nullopt;
};

/// A root-level versioned constraint, and the overridden package that declared it (if any)
struct root_constraint {
    dependency                 dep;
    std::optional<std::string> via;
};

class solver {
    provider_cache&         _cache;
    const package_identity& _root;
    const solve_options&    _opts;

    incompatibility_store _incompats{_root};
    partial_solution      _solution;

    std::map<package_identity, package_version> _overrides;
    std::vector<root_constraint>                _root_constraints;

    /**
     * @brief Run a provider query, translating failures of the provider into a resolution
     * error. Manifest errors and cancellation pass through.
     */
    template <typename Fn>
    decltype(auto) _query(const package_identity& pkg, Fn&& fn) {
        try {
            return fn();
        } catch (const manifest_error&) {
            throw;
        } catch (const user_cancelled&) {
            throw;
        } catch (const std::exception& e) {
            depgraph_log(debug, "Provider query for {} failed: {}", pkg.str(), e.what());
            BOOST_LEAF_THROW_EXCEPTION(resolution_error{provider_failure{pkg, e.what()}});
        } catch (...) {
            depgraph_log(debug, "Provider query for {} threw an unknown exception", pkg.str());
            BOOST_LEAF_THROW_EXCEPTION(
                resolution_error{provider_failure{pkg, "Unknown exception from the provider"}});
        }
    }

    const std::vector<semver::version>& _versions_of(const package_identity& pkg) {
        return _query(pkg, [&]() -> decltype(auto) { return _cache.available_versions(pkg); });
    }

    const package_manifest& _manifest_of(const package_identity& pkg, const package_version& ver) {
        return _query(pkg, [&]() -> decltype(auto) { return _cache.manifest(pkg, ver); });
    }

    package_version _pin_unversioned(const dependency& dep) {
        const auto& pkg = dep.identity;
        return dep.requirement.visit(
            [&](const path_requirement& p) -> package_version { return p; },
            [&](const branch_requirement& b) -> package_version {
                auto& rev = _query(pkg, [&]() -> decltype(auto) {
                    return _cache.resolve_revision(pkg, b.name);
                });
                return revision_pin{rev, b.name};
            },
            [&](const revision_requirement& r) -> package_version {
                auto& rev = _query(pkg, [&]() -> decltype(auto) {
                    return _cache.resolve_revision(pkg, r.id);
                });
                if (rev == r.id) {
                    return revision_pin{rev};
                }
                return revision_pin{rev, std::nullopt, r.id};
            },
            [&](const version_range_set&) -> package_version {
                neo_assert_always(invariant,
                                  false,
                                  "Attempted to pin a versioned requirement as an override",
                                  dep.to_string());
                neo::unreachable();
            });
    }

    [[noreturn]] void _fail_override_conflict(const package_identity& pkg,
                                              std::string_view        first_by,
                                              const requirement&      first,
                                              std::string_view        second_by,
                                              const requirement&      second,
                                              std::vector<package_identity> culprits) {
        auto explanation = neo::ufmt("┌─ Because {} depends on {} {},\n"
                                     "│      and {} depends on {} {},\n"
                                     "╘═    then {} cannot be selected from a single source.\n",
                                     first_by,
                                     pkg.str(),
                                     first.to_string(),
                                     second_by,
                                     pkg.str(),
                                     second.to_string(),
                                     pkg.str());
        BOOST_LEAF_THROW_EXCEPTION(
            resolution_error{version_conflict{std::move(explanation), std::move(culprits)}});
    }

    /**
     * @brief Select the overridden packages: the branch/revision/path dependencies of the root,
     * closed over the unversioned dependencies of those packages.
     */
    void _apply_overrides(const std::vector<dependency>& root_deps) {
        std::map<package_identity, requirement>      override_reqs;
        std::map<package_identity, package_identity> declared_by;
        std::vector<package_identity>                queue;

        for (auto& dep : root_deps) {
            if (dep.identity == _root) {
                depgraph_log(warn, "Ignoring dependency of {} upon itself", _root.str());
                continue;
            }
            if (dep.requirement.is_versioned()) {
                continue;
            }
            auto [it, inserted] = override_reqs.emplace(dep.identity, dep.requirement);
            if (!inserted) {
                if (it->second == dep.requirement) {
                    continue;
                }
                _fail_override_conflict(dep.identity,
                                        _root.str(),
                                        it->second,
                                        _root.str(),
                                        dep.requirement,
                                        {});
            }
            queue.push_back(dep.identity);
        }
        const std::set<package_identity> from_root{queue.begin(), queue.end()};

        for (auto& pkg : queue) {
            _overrides.emplace(pkg, _pin_unversioned(dependency{pkg, override_reqs.at(pkg)}));
        }

        std::vector<root_constraint> inherited;
        for (std::size_t idx = 0; idx < queue.size(); ++idx) {
            cancellation_point(_opts.stop_token);
            // Copy: the queue grows below
            const auto  pkg = queue[idx];
            const auto& ver = _overrides.at(pkg);
            auto        via = neo::ufmt("{} {}", pkg.str(), ver.to_string());

            const package_manifest* man = nullptr;
            try {
                man = &_manifest_of(pkg, ver);
            } catch (const manifest_error& e) {
                BOOST_LEAF_THROW_EXCEPTION(resolution_error{
                    no_usable_version{pkg, {neo::ufmt("{}: {}", ver.to_string(), e.what())}}});
            }

            for (auto& dep : man->dependencies) {
                if (dep.identity == _root || dep.identity == pkg) {
                    continue;
                }
                if (dep.requirement.is_versioned()) {
                    inherited.push_back(root_constraint{dep, via});
                    continue;
                }
                if (from_root.contains(dep.identity)) {
                    // The root's own requirement wins
                    continue;
                }
                auto [it, inserted] = override_reqs.emplace(dep.identity, dep.requirement);
                if (!inserted) {
                    if (it->second == dep.requirement) {
                        continue;
                    }
                    auto& other = declared_by.at(dep.identity);
                    _fail_override_conflict(dep.identity,
                                            other.str(),
                                            it->second,
                                            pkg.str(),
                                            dep.requirement,
                                            {std::min(other, pkg), std::max(other, pkg)});
                }
                declared_by.emplace(dep.identity, pkg);
                _overrides.emplace(dep.identity, _pin_unversioned(dep));
                queue.push_back(dep.identity);
            }
        }

        for (auto& dep : root_deps) {
            if (dep.requirement.is_versioned() && dep.identity != _root
                && !_overrides.contains(dep.identity)) {
                _root_constraints.push_back(root_constraint{dep, std::nullopt});
            }
        }
        for (auto& rc : inherited) {
            if (!_overrides.contains(rc.dep.identity)) {
                _root_constraints.push_back(std::move(rc));
            }
        }

        for (auto& [pkg, ver] : _overrides) {
            depgraph_log(debug,
                         "Using {} {} (overridden by the root package)",
                         pkg.str(),
                         ver.to_string());
        }
    }

    /**
     * @brief Create (but do not attach) the incompatibilities that arise from selecting the
     * given version of a package. Throws manifest_error if the version is unusable.
     */
    std::vector<incompatibility_id> _incompatibilities_for(const package_identity& pkg,
                                                           const semver::version&  ver) {
        std::vector<incompatibility_id> ret;
        if (pkg == _root) {
            for (auto& rc : _root_constraints) {
                ret.push_back(_incompats.create(
                    {
                        term{_root, version_range_set::exactly(root_version), true},
                        term{rc.dep.identity,
                             rc.dep.requirement.as<version_range_set>(),
                             false},
                    },
                    cause::dependency{rc.via}));
            }
            return ret;
        }

        auto& man  = _manifest_of(pkg, ver);
        auto  self = term{pkg, version_range_set::exactly(ver), true};

        auto relevant = [&](const dependency& dep) {
            return dep.identity != pkg && dep.identity != _root
                && !_overrides.contains(dep.identity);
        };

        auto unversioned = std::find_if(man.dependencies.begin(),
                                        man.dependencies.end(),
                                        [&](const dependency& dep) {
                                            return relevant(dep)
                                                && !dep.requirement.is_versioned();
                                        });
        if (unversioned != man.dependencies.end()) {
            ret.push_back(_incompats.create(
                {self},
                cause::unversioned_dependency{unversioned->identity,
                                              unversioned->requirement.to_string()}));
            return ret;
        }

        for (auto& dep : man.dependencies) {
            if (!relevant(dep)) {
                continue;
            }
            ret.push_back(_incompats.create(
                {self, term{dep.identity, dep.requirement.as<version_range_set>(), false}},
                cause::dependency{}));
        }
        return ret;
    }

    propagate_result _propagate_incompatibility(incompatibility_id id) {
        const term* unsatisfied = nullptr;
        for (auto& t : _incompats[id].terms) {
            auto rel = _solution.relation(t);
            if (rel == set_relation::disjoint) {
                // This incompatibility cannot be satisfied, so it tells us nothing
                return {};
            } else if (rel == set_relation::overlapping) {
                if (unsatisfied) {
                    // More than one term is undetermined
                    return {};
                }
                unsatisfied = &t;
            }
        }
        if (!unsatisfied) {
            return {.conflict = true};
        }
        depgraph_log(trace,
                     "Derived {} from: {}",
                     unsatisfied->negate().to_string(),
                     describe_incompatibility(_incompats, id));
        auto pkg = unsatisfied->package;
        _solution.derive(unsatisfied->negate(), id);
        return {.derived = std::move(pkg)};
    }

    void _propagate(package_identity start) {
        std::vector<package_identity> changed{std::move(start)};
        while (!changed.empty()) {
            cancellation_point(_opts.stop_token);
            auto pkg = std::move(changed.front());
            changed.erase(changed.begin());

            auto ids = _incompats.for_package(pkg);
            // Newer incompatibilities are more likely to be relevant
            for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
                auto res = _propagate_incompatibility(*it);
                if (res.conflict) {
                    auto root_cause = _resolve_conflict(*it);
                    auto again      = _propagate_incompatibility(root_cause);
                    neo_assert(invariant,
                               again.derived.has_value(),
                               "Conflict resolution produced an incompatibility that does not "
                               "derive a new assignment",
                               describe_incompatibility(_incompats, root_cause));
                    changed.clear();
                    changed.push_back(std::move(*again.derived));
                    break;
                }
                if (res.derived
                    && std::find(changed.begin(), changed.end(), *res.derived) == changed.end()) {
                    changed.push_back(std::move(*res.derived));
                }
            }
        }
    }

    /**
     * @brief Apply the resolution rule until the conflict yields an incompatibility that can be
     * resolved by backtracking, and backtrack.
     */
    incompatibility_id _resolve_conflict(incompatibility_id incompat) {
        depgraph_log(debug, "Conflict: {}", describe_incompatibility(_incompats, incompat));
        bool created = false;
        while (!_incompats[incompat].is_failure(_root)) {
            // Copy: the store may grow below
            const auto terms = _incompats[incompat].terms;

            const term*         most_recent_term      = nullptr;
            const assignment*   most_recent_satisfier = nullptr;
            std::optional<term> difference;
            int                 previous_satisfier_level = 1;

            for (auto& t : terms) {
                auto& satisfier = _solution.satisfier(t);
                if (!most_recent_satisfier) {
                    most_recent_term      = &t;
                    most_recent_satisfier = &satisfier;
                } else if (most_recent_satisfier->index < satisfier.index) {
                    previous_satisfier_level
                        = std::max(previous_satisfier_level, most_recent_satisfier->decision_level);
                    most_recent_term      = &t;
                    most_recent_satisfier = &satisfier;
                    difference.reset();
                } else {
                    previous_satisfier_level
                        = std::max(previous_satisfier_level, satisfier.decision_level);
                }

                if (most_recent_term == &t) {
                    // If the satisfier is broader than the term, the remainder of it was
                    // satisfied by some earlier assignment
                    difference = most_recent_satisfier->term.difference(*most_recent_term);
                    if (difference) {
                        previous_satisfier_level
                            = std::max(previous_satisfier_level,
                                       _solution.satisfier(difference->negate()).decision_level);
                    }
                }
            }

            if (previous_satisfier_level < most_recent_satisfier->decision_level
                || most_recent_satisfier->is_decision()) {
                depgraph_log(trace, "Backtracking to decision level {}", previous_satisfier_level);
                _solution.backtrack(previous_satisfier_level);
                if (created) {
                    _incompats.attach(incompat);
                }
                return incompat;
            }

            std::vector<term> new_terms;
            for (auto& t : terms) {
                if (&t != most_recent_term) {
                    new_terms.push_back(t);
                }
            }
            const auto satisfier_cause = *most_recent_satisfier->cause;
            for (auto& t : _incompats[satisfier_cause].terms) {
                if (t.package != most_recent_satisfier->term.package) {
                    new_terms.push_back(t);
                }
            }
            if (difference) {
                new_terms.push_back(difference->negate());
            }

            incompat = _incompats.create(std::move(new_terms),
                                         cause::derived{incompat, satisfier_cause});
            created  = true;
            depgraph_log(trace,
                         "Derived incompatibility: {}",
                         describe_incompatibility(_incompats, incompat));
        }
        _fail(incompat);
    }

    /**
     * @brief Load the manifest of every available version of the package. If none is usable,
     * return the reason each one was rejected.
     */
    std::optional<std::vector<std::string>> _inspect_manifests(const package_identity& pkg) {
        std::vector<std::string> reasons;
        auto&                    versions = _versions_of(pkg);
        for (auto it = versions.rbegin(); it != versions.rend(); ++it) {
            try {
                (void)_manifest_of(pkg, *it);
                return std::nullopt;
            } catch (const manifest_error& e) {
                reasons.push_back(neo::ufmt("{}: {}", it->to_string(), e.what()));
            }
        }
        return reasons;
    }

    [[noreturn]] void _fail(incompatibility_id failure) {
        auto explanation = explain_derivation(_incompats, failure);
        depgraph_log(debug, "Dependency resolution failed:\n{}", explanation);

        std::set<package_identity> culprits;
        std::set<package_identity> not_found;
        std::set<package_identity> unavailable;
        std::set<package_identity> no_candidates;

        std::set<incompatibility_id>    seen;
        std::vector<incompatibility_id> stack{failure};
        while (!stack.empty()) {
            auto id = stack.back();
            stack.pop_back();
            if (!seen.insert(id).second) {
                continue;
            }
            auto& inc = _incompats[id];
            inc.cause.visit(
                [&](const cause::derived& d) {
                    stack.push_back(d.left);
                    stack.push_back(d.right);
                },
                [&](const cause::dependency&) {
                    auto& depender = inc.terms.front().package;
                    if (depender != _root) {
                        culprits.insert(depender);
                    }
                },
                [&](const cause::unversioned_dependency&) {
                    culprits.insert(inc.terms.front().package);
                },
                [&](const cause::package_not_found&) {
                    not_found.insert(inc.terms.front().package);
                },
                [&](const cause::unavailable&) { unavailable.insert(inc.terms.front().package); },
                [&](const cause::no_versions&) {
                    no_candidates.insert(inc.terms.front().package);
                },
                [&](const auto&) {});
        }

        if (!not_found.empty()) {
            BOOST_LEAF_THROW_EXCEPTION(
                resolution_error{package_not_found{*not_found.begin(), explanation}});
        }
        for (auto& pkg : unavailable) {
            auto reasons = _inspect_manifests(pkg);
            if (reasons) {
                BOOST_LEAF_THROW_EXCEPTION(
                    resolution_error{no_usable_version{pkg, std::move(*reasons)}});
            }
        }
        if (culprits.empty()) {
            // Only the root's own requirements are involved
            culprits = std::move(no_candidates);
        }
        BOOST_LEAF_THROW_EXCEPTION(resolution_error{
            version_conflict{explanation, {culprits.begin(), culprits.end()}}});
    }

    /// Pick the version to try for the given package. May add an incompatibility instead.
    std::optional<semver::version> _pick_version(const term& t) {
        if (t.package == _root) {
            return root_version;
        }
        auto& versions = _versions_of(t.package);
        if (versions.empty()) {
            _incompats.add({term{t.package, version_range_set::any(), true}},
                           cause::package_not_found{});
            return std::nullopt;
        }

        auto pref = _opts.preferred.find(t.package);
        if (pref != _opts.preferred.end()) {
            auto pinned = pref->second.get_if<semver::version>();
            if (pinned && t.versions.contains(*pinned)
                && std::binary_search(versions.begin(), versions.end(), *pinned)) {
                return *pinned;
            }
        }

        auto allowed_release = std::find_if(versions.rbegin(), versions.rend(), [&](auto&& v) {
            return !v.is_prerelease() && t.versions.contains(v);
        });
        if (allowed_release != versions.rend()) {
            return *allowed_release;
        }
        auto allowed = std::find_if(versions.rbegin(), versions.rend(), [&](auto&& v) {
            return t.versions.contains(v);
        });
        if (allowed != versions.rend()) {
            return *allowed;
        }

        _incompats.add({t}, cause::no_versions{});
        return std::nullopt;
    }

    std::size_t _count_candidates(const term& t) {
        if (t.package == _root) {
            return 1;
        }
        auto& versions = _versions_of(t.package);
        return static_cast<std::size_t>(std::count_if(versions.begin(),
                                                      versions.end(),
                                                      [&](auto&& v) {
                                                          return t.versions.contains(v);
                                                      }));
    }

    /**
     * @brief Decide upon the next package version. Returns the package that changed, or nullopt
     * if every required package has been decided.
     */
    std::optional<package_identity> _choose_package_version() {
        auto undecided = _solution.undecided();
        if (undecided.empty()) {
            return std::nullopt;
        }

        // Fewest candidates first. `undecided` is ordered by identity, so ties go to the
        // lowest identity.
        const term* chosen   = nullptr;
        std::size_t n_chosen = 0;
        for (auto& t : undecided) {
            auto n = _count_candidates(t);
            if (!chosen || n < n_chosen) {
                chosen   = &t;
                n_chosen = n;
            }
        }

        const auto pkg = chosen->package;
        auto       ver = _pick_version(*chosen);
        if (!ver) {
            return pkg;
        }

        std::vector<incompatibility_id> ids;
        try {
            ids = _incompatibilities_for(pkg, *ver);
        } catch (const manifest_error& e) {
            depgraph_log(warn,
                         "Version {} of {} cannot be used: {}",
                         ver->to_string(),
                         pkg.str(),
                         e.what());
            _incompats.add({term{pkg, version_range_set::exactly(*ver), true}},
                           cause::unavailable{e.what()});
            return pkg;
        }

        bool conflict = false;
        for (auto id : ids) {
            _incompats.attach(id);
            auto& inc = _incompats[id];
            conflict  = conflict || std::all_of(inc.terms.begin(), inc.terms.end(), [&](auto&& t) {
                           return t.package == pkg || _solution.satisfies(t);
                       });
            if (_opts.prefetch) {
                for (auto& t : inc.terms) {
                    if (t.package != pkg && t.package != _root) {
                        _cache.prefetch_versions(t.package);
                    }
                }
            }
        }

        if (!conflict) {
            if (pkg != _root) {
                depgraph_log(debug, "Selecting {} {}", pkg.str(), ver->to_string());
            }
            _solution.decide(pkg, *ver);
        } else {
            depgraph_log(trace,
                         "Not selecting {} {}: its dependencies conflict",
                         pkg.str(),
                         ver->to_string());
        }
        return pkg;
    }

public:
    solver(provider_cache& cache, const package_identity& root, const solve_options& opts)
        : _cache(cache)
        , _root(root)
        , _opts(opts) {}

    solution run(const std::vector<dependency>& root_deps) {
        _apply_overrides(root_deps);

        _incompats.add({term{_root, version_range_set::exactly(root_version), false}},
                       cause::root{});

        std::optional<package_identity> next = _root;
        while (next) {
            cancellation_point(_opts.stop_token);
            _propagate(std::move(*next));
            next = _choose_package_version();
        }

        solution ret;
        for (auto& [pkg, ver] : _solution.decisions()) {
            if (pkg != _root) {
                ret.emplace(pkg, ver);
            }
        }
        for (auto& [pkg, ver] : _overrides) {
            ret.emplace(pkg, ver);
        }
        return ret;
    }
};

}  // namespace

solution depgraph::solve(providers                      prov,
                         const package_identity&        root,
                         const std::vector<dependency>& root_dependencies,
                         const solve_options&           opts) {
    depgraph_log(debug, "Resolving dependencies of {}", root.str());
    provider_cache cache{prov, opts.stop_token};
    solver         s{cache, root, opts};
    auto           sln = s.run(root_dependencies);
    for (auto& [pkg, ver] : sln) {
        depgraph_log(debug, "  Resolved: {} {}", pkg.str(), ver.to_string());
    }
    return sln;
}
