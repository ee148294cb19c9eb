#pragma once

#include <depgraph/util/log.hpp>

#include <string>

namespace depgraph::config {

namespace defaults {

/**
 * @brief The number of worker threads used to fetch package manifests while building a package
 * graph. Read from DEPGRAPH_JOBS. Returns zero (meaning "pick based on hardware") if the variable
 * is unset or not a positive integer.
 */
int jobs();

/**
 * @brief Whether the solver will fetch version lists of newly discovered packages on background
 * threads. Disabled if DEPGRAPH_NO_PREFETCH is set to a truthy value.
 */
bool enable_prefetch();

/**
 * @brief The initial log level, read from DEPGRAPH_LOG_LEVEL ("trace", "debug", ...).
 * Defaults to `info`.
 */
log::level log_level();

/**
 * @brief The file name of the lockfile placed beside a root package. Read from
 * DEPGRAPH_LOCKFILE_NAME, defaulting to "depgraph.lock.json"
 */
std::string lockfile_name();

}  // namespace defaults

using namespace defaults;

/**
 * @brief Apply the environment-derived log level and install the log pattern.
 */
void init_from_environment() noexcept;

}  // namespace depgraph::config
