#pragma once

#include "./error.hpp"
#include "./package_graph.hpp"

#include <depgraph/config.hpp>
#include <depgraph/solve/solve.hpp>

#include <optional>
#include <stop_token>
#include <string>

namespace depgraph {

struct graph_options {
    /**
     * @brief The platform being built for. Target dependencies conditioned on other platforms are
     * dropped. If empty, every conditioned dependency is kept.
     */
    std::optional<std::string> platform = std::nullopt;
    /// The number of manifests fetched at once. Zero picks a default from the hardware.
    int jobs = config::jobs();
    /// Cancels the manifest fetches when triggered
    std::stop_token stop_token = {};
};

/**
 * @brief Build and validate the graph of modules needed by the targets of the root package.
 *
 * The manifest of each package in `sln` is fetched concurrently. Once all are available, the
 * graph is validated for unique module names, resolvable references, platform compatibility,
 * and acyclicity, in that order. Targets not reachable from the root's targets are dropped.
 *
 * Throws a `graph_error` error object on validation failure. Failures of the manifest provider
 * propagate unchanged.
 */
[[nodiscard]] package_graph build_package_graph(const package_manifest& root_manifest,
                                                const solution&         sln,
                                                manifest_provider&      manifests,
                                                const graph_options&    opts = {});

}  // namespace depgraph
