#include "./reconcile.hpp"

#include <depgraph/util/log.hpp>
#include <depgraph/util/signal.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <set>

using namespace depgraph;

namespace {

/**
 * Walks the dependency graph from the root using only the pinned versions of a lockfile. Stops at
 * the first requirement that the pins no longer meet.
 */
class pin_walker {
    manifest_provider&      _manifests;
    const package_identity& _root;
    const lockfile&         _lock;
    const std::stop_token&  _stop;

    solution _solution;
    /// The unversioned requirements that replace every other requirement on a package
    std::map<package_identity, requirement> _overrides;
    std::string                             _stale_reason;

    bool _stale(std::string reason) {
        _stale_reason = std::move(reason);
        return false;
    }

    std::optional<package_manifest> _manifest_of(const package_identity& pkg,
                                                 const package_version&  ver) {
        cancellation_point(_stop);
        try {
            return _manifests.manifest(pkg, ver);
        } catch (const manifest_error& e) {
            depgraph_log(debug,
                         "Locked {} {} is unusable: {}",
                         pkg.str(),
                         ver.to_string(),
                         e.what());
            return std::nullopt;
        } catch (const user_cancelled&) {
            throw;
        } catch (const std::exception& e) {
            BOOST_LEAF_THROW_EXCEPTION(resolution_error{provider_failure{pkg, e.what()}});
        } catch (...) {
            BOOST_LEAF_THROW_EXCEPTION(
                resolution_error{provider_failure{pkg, "Unknown exception from the provider"}});
        }
    }

    std::optional<package_version> _pinned_override(const package_identity& pkg,
                                                    const requirement&      req) {
        auto pin = _lock.find(pkg);
        if (auto path = req.get_if<path_requirement>()) {
            if (pin) {
                _stale(neo::ufmt("{} is a local path package, but it is pinned", pkg.str()));
                return std::nullopt;
            }
            return package_version{*path};
        }
        if (!pin || !pin->satisfies(req)) {
            _stale(neo::ufmt("The pin of {} does not match {}", pkg.str(), req.to_string()));
            return std::nullopt;
        }
        return *pin;
    }

    bool _walk_overrides(const std::vector<dependency>& root_deps,
                         std::vector<dependency>&       versioned) {
        std::vector<package_identity> queue;
        std::set<package_identity>    from_root;
        for (auto& dep : root_deps) {
            if (dep.identity == _root || dep.requirement.is_versioned()) {
                continue;
            }
            auto [it, inserted] = _overrides.emplace(dep.identity, dep.requirement);
            if (!inserted) {
                if (it->second != dep.requirement) {
                    return _stale(neo::ufmt("{} is required from two sources", dep.identity.str()));
                }
                continue;
            }
            from_root.insert(dep.identity);
            queue.push_back(dep.identity);
        }

        for (std::size_t idx = 0; idx < queue.size(); ++idx) {
            // Copy: the queue grows below
            const auto pkg = queue[idx];
            auto       ver = _pinned_override(pkg, _overrides.at(pkg));
            if (!ver) {
                return false;
            }
            _solution.emplace(pkg, *ver);
            auto man = _manifest_of(pkg, *ver);
            if (!man) {
                return _stale(
                    neo::ufmt("The locked {} {} is unusable", pkg.str(), ver->to_string()));
            }
            for (auto& dep : man->dependencies) {
                if (dep.identity == _root || dep.identity == pkg) {
                    continue;
                }
                if (dep.requirement.is_versioned()) {
                    versioned.push_back(dep);
                    continue;
                }
                if (from_root.contains(dep.identity)) {
                    continue;
                }
                auto [it, inserted] = _overrides.emplace(dep.identity, dep.requirement);
                if (!inserted) {
                    if (it->second != dep.requirement) {
                        return _stale(
                            neo::ufmt("{} is required from two sources", dep.identity.str()));
                    }
                    continue;
                }
                queue.push_back(dep.identity);
            }
        }
        return true;
    }

    bool _walk_versioned(std::vector<dependency> queue) {
        while (!queue.empty()) {
            auto dep = std::move(queue.back());
            queue.pop_back();
            if (_overrides.contains(dep.identity)) {
                continue;
            }
            auto pin = _lock.find(dep.identity);
            if (!pin) {
                return _stale(neo::ufmt("{} is required, but it is not pinned", dep.to_string()));
            }
            if (!pin->satisfies(dep.requirement)) {
                return _stale(neo::ufmt("The pinned {} {} does not satisfy {}",
                                        dep.identity.str(),
                                        pin->to_string(),
                                        dep.to_string()));
            }
            if (!_solution.emplace(dep.identity, *pin).second) {
                continue;
            }
            auto man = _manifest_of(dep.identity, *pin);
            if (!man) {
                return _stale(neo::ufmt("The locked {} {} is unusable",
                                        dep.identity.str(),
                                        pin->to_string()));
            }
            for (auto& next : man->dependencies) {
                if (next.identity == _root || next.identity == dep.identity
                    || _overrides.contains(next.identity)) {
                    continue;
                }
                if (!next.requirement.is_versioned()) {
                    return _stale(neo::ufmt("The locked {} {} has an unversioned dependency on {}",
                                            dep.identity.str(),
                                            pin->to_string(),
                                            next.identity.str()));
                }
                queue.push_back(next);
            }
        }
        return true;
    }

    bool _check_complete() {
        for (auto& [pkg, ver] : _lock.pins()) {
            if (!_solution.contains(pkg)) {
                return _stale(neo::ufmt("{} is pinned, but it is no longer required", pkg.str()));
            }
        }
        return true;
    }

public:
    pin_walker(manifest_provider&      manifests,
               const package_identity& root,
               const lockfile&         lock,
               const std::stop_token&  stop)
        : _manifests(manifests)
        , _root(root)
        , _lock(lock)
        , _stop(stop) {}

    std::optional<solution> run(const std::vector<dependency>& root_deps) {
        std::vector<dependency> versioned;
        for (auto& dep : root_deps) {
            if (dep.identity != _root && dep.requirement.is_versioned()) {
                versioned.push_back(dep);
            }
        }
        if (!_walk_overrides(root_deps, versioned) || !_walk_versioned(std::move(versioned))
            || !_check_complete()) {
            depgraph_log(info, "The lockfile is out of date: {}", _stale_reason);
            return std::nullopt;
        }
        return std::move(_solution);
    }
};

}  // namespace

reconcile_result depgraph::reconcile(providers                      prov,
                                     const package_identity&        root,
                                     const std::vector<dependency>& root_dependencies,
                                     const std::optional<lockfile>& existing,
                                     const solve_options&           opts) {
    if (existing) {
        depgraph_log(debug, "Checking the {} pins of the lockfile", existing->pins().size());
        pin_walker walker{prov.manifests, root, *existing, opts.stop_token};
        if (auto sln = walker.run(root_dependencies)) {
            depgraph_log(info, "The lockfile is up to date");
            return reconcile_result{std::move(*sln), true};
        }
    }

    auto solve_opts = opts;
    if (existing) {
        for (auto& [pkg, ver] : existing->pins()) {
            solve_opts.preferred.emplace(pkg, ver);
        }
    }
    return reconcile_result{solve(prov, root, root_dependencies, solve_opts), false};
}
