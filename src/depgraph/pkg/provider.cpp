#include "./provider.hpp"

#include <neo/ufmt.hpp>

#include <type_traits>

using namespace depgraph;

requirement_kind package_version::kind() const noexcept {
    return visit([](const semver::version&) { return requirement_kind::version; },
                 [](const revision_pin& r) {
                     return r.branch ? requirement_kind::branch : requirement_kind::revision;
                 },
                 [](const path_requirement&) { return requirement_kind::path; });
}

bool package_version::satisfies(const requirement& req) const noexcept {
    return visit(
        [&](const semver::version& v) {
            auto rng = req.get_if<version_range_set>();
            return rng && rng->contains(v);
        },
        [&](const revision_pin& r) {
            if (auto br = req.get_if<branch_requirement>()) {
                return r.branch == br->name;
            }
            if (auto rev = req.get_if<revision_requirement>()) {
                return !r.branch && r.requested.value_or(r.revision) == rev->id;
            }
            return false;
        },
        [&](const path_requirement& p) {
            auto want = req.get_if<path_requirement>();
            return want && *want == p;
        });
}

std::string package_version::to_string() const noexcept {
    return visit([](const semver::version& v) { return v.to_string(); },
                 [](const revision_pin& r) {
                     if (r.branch) {
                         return neo::ufmt("{} ({})", *r.branch, r.revision);
                     }
                     if (r.requested) {
                         return neo::ufmt("{} ({})", *r.requested, r.revision);
                     }
                     return r.revision;
                 },
                 [](const path_requirement& p) { return p.path.generic_string(); });
}

std::string package_version::key() const noexcept {
    return visit([](const semver::version& v) { return "version:" + v.to_string(); },
                 [](const revision_pin& r) {
                     return neo::ufmt("revision:{}@{}", r.revision, r.branch.value_or(""));
                 },
                 [](const path_requirement& p) { return "path:" + p.path.generic_string(); });
}

bool depgraph::operator==(const package_version& lhs, const package_version& rhs) noexcept {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    return lhs.visit([&](const auto& l) {
        using T = std::remove_cvref_t<decltype(l)>;
        return l == rhs.as<T>();
    });
}
