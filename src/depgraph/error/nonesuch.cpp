#include "./nonesuch.hpp"

#include <depgraph/util/log.hpp>

#include <neo/ufmt.hpp>

using namespace depgraph;

std::string e_nonesuch::suggestion() const {
    if (!nearest) {
        return "";
    }
    return neo::ufmt(" (Did you mean '{}'?)", *nearest);
}

void e_nonesuch::log_error() const noexcept {
    depgraph_log(error, "  No {} named '{}'{}", kind, given, suggestion());
}
