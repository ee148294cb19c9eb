#include "./error.hpp"

#include <depgraph/error/nonesuch.hpp>
#include <depgraph/util/log.hpp>

#include <fmt/ranges.h>
#include <neo/ufmt.hpp>

using namespace depgraph;

std::string graph_error::message() const noexcept {
    return visit(
        [](const duplicate_module& d) {
            return fmt::format("More than one package exposes a target named '{}': {}",
                               d.module,
                               fmt::join(d.packages, ", "));
        },
        [](const unresolved_product_reference& u) {
            return neo::ufmt("Target '{}' depends on product '{}' of package '{}', which does not "
                             "exist{}",
                             u.target,
                             u.product,
                             u.package.str(),
                             e_nonesuch{"product", u.product, u.nearest}.suggestion());
        },
        [](const unresolved_target_reference& u) {
            return neo::ufmt("'{}' refers to a target '{}', which does not exist{}",
                             u.target,
                             u.dependency,
                             e_nonesuch{"target", u.dependency, u.nearest}.suggestion());
        },
        [](const incompatible_platform& p) {
            return neo::ufmt("Package '{}' supports {} {}, but its dependency '{}' requires {} {}",
                             p.package.str(),
                             p.platform,
                             p.declared.to_string(),
                             p.dependency.str(),
                             p.platform,
                             p.required.to_string());
        },
        [](const dependency_cycle& c) {
            auto path = c.path;
            if (!path.empty()) {
                path.push_back(path.front());
            }
            return fmt::format("Cyclic dependency found: {}", fmt::join(path, " uses "));
        });
}

void graph_error::log_error() const noexcept {
    visit(
        [](const unresolved_product_reference& u) {
            depgraph_log(error,
                         "Target '{}' refers to a product of '{}' that does not exist",
                         u.target,
                         u.package.str());
            e_nonesuch{"product", u.product, u.nearest}.log_error();
        },
        [](const unresolved_target_reference& u) {
            depgraph_log(error, "'{}' refers to a target that does not exist", u.target);
            e_nonesuch{"target", u.dependency, u.nearest}.log_error();
        },
        [this](const auto&) { depgraph_log(error, "{}", message()); });
}
