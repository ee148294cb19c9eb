#pragma once

#include <depgraph/pkg/manifest.hpp>
#include <depgraph/pkg/provider.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

/**
 * @brief A package selected by resolution, together with its manifest at the selected version
 */
struct resolved_package {
    package_identity identity;
    /// The selected version. Empty for the root package.
    std::optional<package_version> version;
    package_manifest               manifest;
};

/**
 * @brief The compiled unit that corresponds to a single target.
 *
 * Modules are named after their targets, and those names are unique within a graph.
 */
struct graph_module {
    std::string      name;
    package_identity package;
    target_kind      kind = target_kind::regular;
    /// The names of the modules this module depends upon directly
    std::vector<std::string> dependencies = {};
};

/**
 * @brief A fully validated build graph. Produced by build_package_graph().
 */
class package_graph {
    package_identity                                _root;
    std::map<package_identity, resolved_package>    _packages;
    std::vector<graph_module>                       _modules;
    std::map<std::string, std::vector<std::string>> _closures;

public:
    package_graph(package_identity                                root,
                  std::map<package_identity, resolved_package>    packages,
                  std::vector<graph_module>                       modules,
                  std::map<std::string, std::vector<std::string>> closures) noexcept
        : _root(std::move(root))
        , _packages(std::move(packages))
        , _modules(std::move(modules))
        , _closures(std::move(closures)) {}

    const package_identity& root() const noexcept { return _root; }

    /// Every package taking part in the graph, including the root
    const auto& packages() const noexcept { return _packages; }

    /// Modules in dependency order: every module appears after the modules it depends on
    const std::vector<graph_module>& modules() const noexcept { return _modules; }

    const resolved_package* find_package(const package_identity&) const noexcept;
    const graph_module*     find_module(std::string_view name) const noexcept;

    /**
     * @brief The modules needed to build the given target of the root package, in dependency
     * order and including the target's own module. Empty if the root has no such target.
     */
    const std::vector<std::string>& closure(std::string_view root_target) const noexcept;
};

}  // namespace depgraph
