#pragma once

#include <depgraph/pkg/identity.hpp>
#include <depgraph/util/wrap_var.hpp>

#include <string>
#include <vector>

namespace depgraph {

/**
 * @brief The requirements cannot all be satisfied at once.
 */
struct version_conflict {
    /// Human-readable derivation of the conflict
    std::string explanation;
    /**
     * The packages whose declared dependencies take part in the conflict. If only the root's
     * requirements take part, the packages that have no version matching them.
     */
    std::vector<package_identity> culprits;
};

/**
 * @brief A required package is not known to the version provider
 */
struct package_not_found {
    package_identity identity;
    std::string      explanation;
};

/**
 * @brief No version of a required package has a usable manifest
 */
struct no_usable_version {
    package_identity identity;
    /// One entry per version that was tried, with the reason it was rejected
    std::vector<std::string> reasons;
};

/**
 * @brief A provider failed for reasons other than a bad manifest
 */
struct provider_failure {
    package_identity identity;
    std::string      message;
};

/**
 * @brief Error object for a failed dependency resolution.
 *
 * Thrown as a Boost.LEAF error object. Handle it with `depgraph_leaf_catch(resolution_error)`.
 */
class resolution_error : public variant_wrapper<version_conflict,
                                                package_not_found,
                                                no_usable_version,
                                                provider_failure> {
public:
    using variant_wrapper::variant_wrapper;

    using variant_wrapper::as;
    using variant_wrapper::get_if;
    using variant_wrapper::is;
    using variant_wrapper::visit;

    /// A multi-line message describing the failure
    std::string message() const noexcept;

    void log_error() const noexcept;
};

}  // namespace depgraph
