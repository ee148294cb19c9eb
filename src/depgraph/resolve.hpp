#pragma once

#include <depgraph/config.hpp>
#include <depgraph/graph/build.hpp>
#include <depgraph/lock/reconcile.hpp>

#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>

namespace depgraph {

struct workspace_params {
    /// The services that supply package manifests and versions
    depgraph::providers providers;
    /// The manifest of the package being resolved for
    package_manifest root;
    /// The lockfile to read and update. If empty, no lockfile is used.
    std::optional<std::filesystem::path> lockfile_path = std::nullopt;
    /// The platform being built for. See graph_options::platform
    std::optional<std::string> platform   = std::nullopt;
    int                        jobs       = config::jobs();
    bool                       prefetch   = config::enable_prefetch();
    std::stop_token            stop_token = {};
};

/**
 * @brief The path of the lockfile that belongs to the root package in the given directory
 */
std::filesystem::path default_lockfile_path(const std::filesystem::path& project_dir);

/**
 * @brief Resolve the dependencies of the root package and build its package graph.
 *
 * The lockfile (if any) is reconciled with the dependencies of the root. It is rewritten only
 * once both the resolution and the package graph succeed. On any failure, nothing is written.
 *
 * Throws the errors of `reconcile()` and `build_package_graph()`, and `e_invalid_lockfile` if
 * the existing lockfile cannot be read.
 */
[[nodiscard]] package_graph resolve_workspace(const workspace_params& params);

}  // namespace depgraph
