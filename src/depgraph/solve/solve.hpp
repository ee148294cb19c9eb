#pragma once

#include "./error.hpp"

#include <depgraph/config.hpp>
#include <depgraph/pkg/provider.hpp>

#include <map>
#include <stop_token>
#include <vector>

namespace depgraph {

/**
 * @brief The result of dependency resolution: the chosen version of every package required by
 * the root, excluding the root itself.
 */
using solution = std::map<package_identity, package_version>;

struct solve_options {
    /// Versions to select where they are still allowed, usually from a prior lockfile
    std::map<package_identity, package_version> preferred = {};
    /// Fetch the version lists of newly discovered packages on background threads
    bool prefetch = config::enable_prefetch();
    /// Cancels the resolution when triggered
    std::stop_token stop_token = {};
};

/**
 * @brief Find a version of every package transitively required by `root_dependencies` that
 * satisfies every requirement.
 *
 * Branch, revision, and path requirements declared by the root override every other requirement
 * on those packages. Those packages are not version-solved.
 *
 * On failure, throws a `resolution_error` error object. If cancelled, throws `user_cancelled`.
 *
 * @param prov The package providers to query. Queries are memoized for this call.
 * @param root The identity of the package being resolved for
 * @param root_dependencies The dependencies declared by the root package
 */
[[nodiscard]] solution solve(providers                      prov,
                             const package_identity&        root,
                             const std::vector<dependency>& root_dependencies,
                             const solve_options&           opts = {});

}  // namespace depgraph
