#include "./error.hpp"

#include <depgraph/util/log.hpp>

#include <neo/ufmt.hpp>

using namespace depgraph;

std::string resolution_error::message() const noexcept {
    return visit(
        [](const version_conflict& c) {
            return "Dependency resolution failed due to a version conflict:\n" + c.explanation;
        },
        [](const package_not_found& nf) {
            return neo::ufmt("No versions of package '{}' could be found:\n{}",
                             nf.identity.str(),
                             nf.explanation);
        },
        [](const no_usable_version& nu) {
            std::string ret
                = neo::ufmt("No version of package '{}' has a usable manifest:", nu.identity.str());
            for (auto& r : nu.reasons) {
                ret += "\n  - " + r;
            }
            return ret;
        },
        [](const provider_failure& pf) {
            return neo::ufmt("Failed to query package '{}': {}", pf.identity.str(), pf.message);
        });
}

void resolution_error::log_error() const noexcept { depgraph_log(error, "{}", message()); }
