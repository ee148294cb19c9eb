#pragma once

#include "./identity.hpp"
#include "./requirement.hpp"

#include <depgraph/util/wrap_var.hpp>

#include <semver/version.hpp>

#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace depgraph {

/**
 * @brief Thrown by a manifest_provider when the manifest for a particular version of a package
 * cannot be read or is malformed. Only that version becomes unusable.
 */
class manifest_error : public std::runtime_error {
public:
    using runtime_error::runtime_error;
};

enum class target_kind {
    regular,
    executable,
    test,
};

/// A dependency on another target within the same package
struct sibling_target_ref {
    std::string name;
};

/// A dependency on a product exposed by another package
struct product_ref {
    std::string      product;
    package_identity package;
};

/**
 * @brief The thing a target depends upon: either a sibling target or a product of another package
 */
class target_ref : public variant_wrapper<sibling_target_ref, product_ref> {
public:
    using variant_wrapper::variant_wrapper;

    using variant_wrapper::as;
    using variant_wrapper::get_if;
    using variant_wrapper::is;
    using variant_wrapper::visit;

    std::string to_string() const noexcept;
};

struct target_dependency {
    target_ref ref;
    /// If non-empty, the dependency only applies when building for one of these platforms
    std::vector<std::string> platforms = {};

    bool applies_to(std::string_view platform) const noexcept;
};

struct target {
    std::string                    name;
    target_kind                    kind         = target_kind::regular;
    std::vector<target_dependency> dependencies = {};
};

struct product {
    std::string              name;
    std::vector<std::string> targets = {};
};

/**
 * @brief The declared content of one version of a package, as produced by a manifest_provider
 */
struct package_manifest {
    package_identity        identity;
    std::vector<dependency> dependencies = {};
    std::vector<target>     targets      = {};
    std::vector<product>    products     = {};
    /// The minimum supported version of each platform named by the package
    std::map<std::string, semver::version> platforms = {};
    /// If set, this package stands in for another package of the given identity
    std::optional<package_identity> replaces = std::nullopt;

    const target*  find_target(std::string_view name) const noexcept;
    const product* find_product(std::string_view name) const noexcept;
};

}  // namespace depgraph
