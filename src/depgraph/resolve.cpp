#include "./resolve.hpp"

#include <depgraph/util/log.hpp>
#include <depgraph/util/signal.hpp>

using namespace depgraph;

std::filesystem::path depgraph::default_lockfile_path(const std::filesystem::path& project_dir) {
    return project_dir / config::lockfile_name();
}

package_graph depgraph::resolve_workspace(const workspace_params& params) {
    const auto& root = params.root.identity;
    depgraph_log(info, "Resolving dependencies of {}", root.str());

    std::optional<lockfile> prior;
    if (params.lockfile_path) {
        prior = lockfile::load_if_exists(*params.lockfile_path);
    }

    auto res   = reconcile(params.providers,
                         root,
                         params.root.dependencies,
                         prior,
                         solve_options{.prefetch   = params.prefetch,
                                       .stop_token = params.stop_token});
    auto graph = build_package_graph(params.root,
                                     res.solution,
                                     params.providers.manifests,
                                     graph_options{.platform   = params.platform,
                                                   .jobs       = params.jobs,
                                                   .stop_token = params.stop_token});
    cancellation_point(params.stop_token);

    if (params.lockfile_path) {
        auto next = lockfile::from_solution(res.solution);
        if (prior == next) {
            depgraph_log(debug, "Lockfile [{}] is unchanged", params.lockfile_path->string());
        } else {
            next.save(*params.lockfile_path);
        }
    }
    depgraph_log(info,
                 "Resolved {} packages for {}{}",
                 res.solution.size(),
                 root.str(),
                 res.used_fast_path ? " (from the lockfile)" : "");
    return graph;
}
