#pragma once

#include <depgraph/pkg/identity.hpp>
#include <depgraph/util/wrap_var.hpp>

#include <semver/version.hpp>

#include <optional>
#include <string>
#include <vector>

namespace depgraph {

/// Two packages expose a target of the same name
struct duplicate_module {
    std::string                   module;
    std::vector<package_identity> packages;
};

/// A target depends on a product that its package does not expose
struct unresolved_product_reference {
    std::string                target;
    std::string                product;
    package_identity           package;
    std::optional<std::string> nearest;
};

/// A target (or product) names a target that does not exist in the same package
struct unresolved_target_reference {
    std::string                target;
    std::string                dependency;
    std::optional<std::string> nearest;
};

/// A dependency requires a newer version of a platform than its dependent supports
struct incompatible_platform {
    package_identity package;
    package_identity dependency;
    std::string      platform;
    semver::version  declared;
    semver::version  required;
};

/// Targets depend upon each other in a loop. Each module of the loop appears once.
struct dependency_cycle {
    std::vector<std::string> path;
};

/**
 * @brief Error object for a package graph that fails validation.
 */
class graph_error : public variant_wrapper<duplicate_module,
                                           unresolved_product_reference,
                                           unresolved_target_reference,
                                           incompatible_platform,
                                           dependency_cycle> {
public:
    using variant_wrapper::variant_wrapper;

    using variant_wrapper::as;
    using variant_wrapper::get_if;
    using variant_wrapper::is;
    using variant_wrapper::visit;

    std::string message() const noexcept;

    void log_error() const noexcept;
};

}  // namespace depgraph
