#pragma once

#include "./lockfile.hpp"

#include <depgraph/solve/solve.hpp>

#include <optional>
#include <vector>

namespace depgraph {

struct reconcile_result {
    depgraph::solution solution;
    /// `true` if the lockfile was still valid and the solver did not run
    bool used_fast_path = false;
};

/**
 * @brief Obtain a solution for the dependencies of the root package, reusing a prior lockfile
 * where possible.
 *
 * If every requirement reachable from the root through the pinned versions is satisfied by its
 * pin, and exactly the pinned packages are reached, then the pins are the solution. Only the
 * manifest provider is consulted in that case. Otherwise, `solve()` is run with the pins as
 * preferred versions, so that pins that are still allowed are kept.
 *
 * Errors are those of `solve()`.
 */
[[nodiscard]] reconcile_result reconcile(providers                      prov,
                                         const package_identity&        root,
                                         const std::vector<dependency>& root_dependencies,
                                         const std::optional<lockfile>& existing,
                                         const solve_options&           opts = {});

}  // namespace depgraph
