#include "./build.hpp"

#include <depgraph/dym.hpp>
#include <depgraph/util/log.hpp>
#include <depgraph/util/parallel.hpp>
#include <depgraph/util/signal.hpp>

#include <boost/leaf/exception.hpp>
#include <fmt/ranges.h>
#include <neo/assert.hpp>

#include <algorithm>
#include <numeric>
#include <set>

using namespace depgraph;

namespace {

// The DFS visited status for a vertex
enum class vertex_status {
    unvisited,  // Never seen before
    visiting,   // Currently looking at its children; helps find cycles
    visited,    // Finished examining
};

struct vertex_info {
    vertex_status status = vertex_status::unvisited;
    // When `visiting`, the child currently being searched. Chased to recover a cycle.
    std::string next;
};

class graph_builder {
    const package_identity& _root;
    const graph_options&    _opts;

    std::map<package_identity, resolved_package> _packages;
    /// The package that provides each module
    std::map<std::string, package_identity> _owners;
    std::map<std::string, graph_module>     _modules;
    /// Package-level edges taken by target dependencies, as (dependent, dependency)
    std::set<std::pair<package_identity, package_identity>> _package_edges;

    bool _replaces(const package_identity& pkg, const package_identity& other) const {
        return _packages.at(pkg).manifest.replaces == other;
    }

    const resolved_package* _find_provider(const package_identity& pkg) const {
        auto found = _packages.find(pkg);
        if (found != _packages.end()) {
            return &found->second;
        }
        // A package that stands in for the requested one
        for (auto& [id, rp] : _packages) {
            if (rp.manifest.replaces == pkg) {
                return &rp;
            }
        }
        return nullptr;
    }

    void _check_unique() {
        for (auto& [id, rp] : _packages) {
            for (auto& tgt : rp.manifest.targets) {
                auto [it, inserted] = _owners.emplace(tgt.name, id);
                if (inserted) {
                    continue;
                }
                const auto other = it->second;
                if (other != id && _replaces(id, other)) {
                    depgraph_log(debug,
                                 "Module '{}' of {} is replaced by that of {}",
                                 tgt.name,
                                 other.str(),
                                 id.str());
                    it->second = id;
                    continue;
                }
                if (other != id && _replaces(other, id)) {
                    continue;
                }
                std::vector<package_identity> packages{other};
                if (other != id) {
                    packages.push_back(id);
                }
                BOOST_LEAF_THROW_EXCEPTION(
                    graph_error{duplicate_module{tgt.name, std::move(packages)}});
            }
        }
    }

    std::vector<std::string> _product_modules(const target& from, const product_ref& ref) {
        auto provider = _find_provider(ref.package);
        if (!provider) {
            BOOST_LEAF_THROW_EXCEPTION(graph_error{
                unresolved_product_reference{from.name, ref.product, ref.package, std::nullopt}});
        }
        auto prod = provider->manifest.find_product(ref.product);
        if (!prod) {
            BOOST_LEAF_THROW_EXCEPTION(graph_error{unresolved_product_reference{
                from.name,
                ref.product,
                ref.package,
                did_you_mean(ref.product, provider->manifest.products, &product::name)}});
        }
        for (auto& tname : prod->targets) {
            if (!provider->manifest.find_target(tname)) {
                BOOST_LEAF_THROW_EXCEPTION(graph_error{unresolved_target_reference{
                    prod->name,
                    tname,
                    did_you_mean(tname, provider->manifest.targets, &target::name)}});
            }
        }
        return prod->targets;
    }

    void _resolve_references() {
        for (auto& [name, owner_id] : _owners) {
            auto& owner = _packages.at(owner_id);
            auto  tgt   = owner.manifest.find_target(name);
            neo_assert(invariant, tgt != nullptr, "Module has no target", name, owner_id.str());

            graph_module mod{.name = name, .package = owner_id, .kind = tgt->kind};
            for (auto& dep : tgt->dependencies) {
                auto dep_modules = dep.ref.visit(
                    [&](const sibling_target_ref& sib) {
                        if (!owner.manifest.find_target(sib.name)) {
                            BOOST_LEAF_THROW_EXCEPTION(graph_error{unresolved_target_reference{
                                name,
                                sib.name,
                                did_you_mean(sib.name, owner.manifest.targets, &target::name)}});
                        }
                        return std::vector<std::string>{sib.name};
                    },
                    [&](const product_ref& ref) { return _product_modules(*tgt, ref); });
                if (_opts.platform && !dep.applies_to(*_opts.platform)) {
                    depgraph_log(trace,
                                 "Dropping dependency of '{}' on {}: not used on {}",
                                 name,
                                 dep.ref.to_string(),
                                 *_opts.platform);
                    continue;
                }
                if (auto ref = dep.ref.get_if<product_ref>()) {
                    auto provider = _find_provider(ref->package);
                    if (provider->identity != owner_id) {
                        _package_edges.emplace(owner_id, provider->identity);
                    }
                }
                for (auto& m : dep_modules) {
                    if (std::find(mod.dependencies.begin(), mod.dependencies.end(), m)
                        == mod.dependencies.end()) {
                        mod.dependencies.push_back(m);
                    }
                }
            }
            _modules.emplace(name, std::move(mod));
        }
    }

    void _check_platforms() {
        for (auto& [dependent, dependency] : _package_edges) {
            auto& declared = _packages.at(dependent).manifest.platforms;
            for (auto& [platform, required] : _packages.at(dependency).manifest.platforms) {
                auto found = declared.find(platform);
                if (found != declared.end() && found->second < required) {
                    BOOST_LEAF_THROW_EXCEPTION(graph_error{incompatible_platform{
                        dependent,
                        dependency,
                        platform,
                        found->second,
                        required,
                    }});
                }
            }
        }
    }

    // Implements a recursive DFS.
    // Returns a module in a cycle if one exists. The `vertex_info->next`s can be chased to
    // recover the cycle.
    std::optional<std::string> _find_cycle(std::map<std::string, vertex_info>& vertices,
                                           const std::string&                  name) {
        vertex_info& info = vertices[name];
        if (info.status == vertex_status::visited) {
            return std::nullopt;
        } else if (info.status == vertex_status::visiting) {
            return name;
        }
        info.status = vertex_status::visiting;
        for (auto& next : _modules.at(name).dependencies) {
            info.next = next;
            if (auto cycle = _find_cycle(vertices, next)) {
                return cycle;
            }
        }
        info.status = vertex_status::visited;
        return std::nullopt;
    }

    void _check_acyclic(const std::vector<std::string>& roots) {
        depgraph_log(debug, "Searching for dependency cycles");
        std::map<std::string, vertex_info> vertices;
        for (auto& root : roots) {
            auto cyclic = _find_cycle(vertices, root);
            if (!cyclic) {
                continue;
            }
            std::vector<std::string> cycle;
            auto                     cur = *cyclic;
            do {
                cycle.push_back(cur);
                cur = vertices.at(cur).next;
            } while (cur != *cyclic);
            BOOST_LEAF_THROW_EXCEPTION(graph_error{dependency_cycle{std::move(cycle)}});
        }
    }

    void _collect(const std::string&        name,
                  std::set<std::string>&    seen,
                  std::vector<std::string>& out) const {
        if (!seen.insert(name).second) {
            return;
        }
        for (auto& dep : _modules.at(name).dependencies) {
            _collect(dep, seen, out);
        }
        out.push_back(name);
    }

public:
    graph_builder(const package_identity& root, const graph_options& opts)
        : _root(root)
        , _opts(opts) {}

    void add_package(resolved_package rp) {
        auto id = rp.identity;
        _packages.emplace(std::move(id), std::move(rp));
    }

    package_graph build() && {
        _check_unique();
        _resolve_references();
        _check_platforms();

        std::vector<std::string> roots;
        for (auto& tgt : _packages.at(_root).manifest.targets) {
            if (_owners.at(tgt.name) == _root) {
                roots.push_back(tgt.name);
            }
        }
        _check_acyclic(roots);

        std::set<std::string>                           seen;
        std::vector<std::string>                        order;
        std::map<std::string, std::vector<std::string>> closures;
        for (auto& root : roots) {
            _collect(root, seen, order);
            std::set<std::string>    closure_seen;
            std::vector<std::string> closure;
            _collect(root, closure_seen, closure);
            closures.emplace(root, std::move(closure));
        }

        std::vector<graph_module> modules;
        for (auto& name : order) {
            modules.push_back(std::move(_modules.at(name)));
        }
        for (auto& [name, mod] : _modules) {
            if (!seen.contains(name)) {
                depgraph_log(trace, "Module '{}' is not used by {}", name, _root.str());
            }
        }
        depgraph_log(debug,
                     "Package graph of {} has {} modules from {} packages",
                     _root.str(),
                     modules.size(),
                     _packages.size());
        return package_graph{_root, std::move(_packages), std::move(modules), std::move(closures)};
    }
};

}  // namespace

const resolved_package* package_graph::find_package(const package_identity& id) const noexcept {
    auto found = _packages.find(id);
    return found == _packages.end() ? nullptr : &found->second;
}

const graph_module* package_graph::find_module(std::string_view name) const noexcept {
    auto found = std::find_if(_modules.begin(), _modules.end(), [&](const graph_module& m) {
        return m.name == name;
    });
    return found == _modules.end() ? nullptr : &*found;
}

const std::vector<std::string>&
package_graph::closure(std::string_view root_target) const noexcept {
    static const std::vector<std::string> empty;
    auto found = _closures.find(std::string(root_target));
    return found == _closures.end() ? empty : found->second;
}

package_graph depgraph::build_package_graph(const package_manifest& root_manifest,
                                            const solution&         sln,
                                            manifest_provider&      manifests,
                                            const graph_options&    opts) {
    const auto& root = root_manifest.identity;
    depgraph_log(debug, "Loading the manifests of {} packages", sln.size());

    std::vector<std::pair<package_identity, package_version>> todo(sln.begin(), sln.end());
    std::vector<std::optional<package_manifest>> fetched(todo.size());
    std::vector<std::size_t>                     indices(todo.size());
    std::iota(indices.begin(), indices.end(), std::size_t(0));

    parallel_run(indices, opts.jobs, [&](std::size_t idx) {
        cancellation_point(opts.stop_token);
        auto& [pkg, ver] = todo[idx];
        depgraph_log(trace, "Loading manifest of {} {}", pkg.str(), ver.to_string());
        fetched[idx] = manifests.manifest(pkg, ver);
    });
    cancellation_point(opts.stop_token);

    graph_builder builder{root, opts};
    builder.add_package(resolved_package{root, std::nullopt, root_manifest});
    for (std::size_t idx = 0; idx < todo.size(); ++idx) {
        builder.add_package(resolved_package{todo[idx].first,
                                             std::move(todo[idx].second),
                                             std::move(*fetched[idx])});
    }
    return std::move(builder).build();
}
