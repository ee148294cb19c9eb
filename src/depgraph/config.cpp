#include "./config.hpp"

#include <depgraph/util/env.hpp>

using namespace depgraph;

int config::defaults::jobs() { return env_positive_int("DEPGRAPH_JOBS").value_or(0); }

bool config::defaults::enable_prefetch() { return !env_flag("DEPGRAPH_NO_PREFETCH"); }

log::level config::defaults::log_level() {
    auto s = env_string("DEPGRAPH_LOG_LEVEL");
    if (!s) {
        return log::level::info;
    }
    auto lvl = log::level_from_string(*s);
    if (!lvl) {
        depgraph_log(warn, "Ignoring unknown DEPGRAPH_LOG_LEVEL value '{}'", *s);
        return log::level::info;
    }
    return *lvl;
}

std::string config::defaults::lockfile_name() {
    return env_string("DEPGRAPH_LOCKFILE_NAME").value_or("depgraph.lock.json");
}

void config::init_from_environment() noexcept {
    log::init_logger();
    log::current_log_level = log_level();
}
