#pragma once

#include "./identity.hpp"
#include "./manifest.hpp"
#include "./requirement.hpp"

#include <depgraph/util/wrap_var.hpp>

#include <semver/version.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depgraph {

/**
 * @brief A concrete revision of a repository, possibly reached by following a branch
 */
struct revision_pin {
    std::string                revision;
    std::optional<std::string> branch = std::nullopt;
    /// The revision that was asked for, when the provider resolved it to a different identifier
    std::optional<std::string> requested = std::nullopt;

    bool operator==(const revision_pin&) const noexcept = default;
};

/**
 * @brief The concrete thing chosen for a package: a released version, a revision, or a local
 * directory.
 */
class package_version
    : public variant_wrapper<semver::version, revision_pin, path_requirement> {
public:
    using variant_wrapper::variant_wrapper;

    using variant_wrapper::as;
    using variant_wrapper::get_if;
    using variant_wrapper::is;
    using variant_wrapper::visit;

    /// The kind of requirement that produces this kind of version
    requirement_kind kind() const noexcept;

    /// Check whether this version satisfies the given requirement
    bool satisfies(const requirement& req) const noexcept;

    std::string to_string() const noexcept;

    /// A string that is unique for each distinct version, for use as a map key
    std::string key() const noexcept;

    friend bool operator==(const package_version& lhs, const package_version& rhs) noexcept;
};

bool operator==(const package_version& lhs, const package_version& rhs) noexcept;

/**
 * @brief Source of package manifests.
 *
 * Implementations throw manifest_error if the manifest of the given version is unreadable or
 * malformed. Any other exception is treated as a failure of the provider itself.
 */
class manifest_provider {
public:
    virtual ~manifest_provider() = default;

    virtual package_manifest manifest(const package_identity&, const package_version&) = 0;
};

/**
 * @brief Source of available versions and revisions of packages.
 */
class version_provider {
public:
    virtual ~version_provider() = default;

    /**
     * @brief Obtain the released versions of the package. An empty list means the package is
     * not known.
     */
    virtual std::vector<semver::version> available_versions(const package_identity&) = 0;

    /**
     * @brief Resolve a branch name or revision of the package's repository to a concrete
     * revision identifier.
     */
    virtual std::string resolve_revision(const package_identity&, std::string_view ref) = 0;

    /**
     * @brief Obtain the source tree of the given version of a package
     */
    virtual std::filesystem::path checkout(const package_identity&, const package_version&) = 0;
};

/**
 * @brief The pair of external services consumed by resolution
 */
struct providers {
    depgraph::manifest_provider& manifests;
    depgraph::version_provider&  versions;
};

}  // namespace depgraph
