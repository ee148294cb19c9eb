#pragma once

#include <depgraph/pkg/provider.hpp>

#include <initializer_list>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <string_view>

namespace depgraph::testing {

/**
 * @brief An in-memory implementation of both package providers, for use in tests.
 *
 * Every package added receives a default target and a product both named after the package. The
 * target depends upon the product of the same name of each declared dependency. The returned
 * manifest may be modified to build other shapes.
 *
 * All queries are counted.
 */
class memory_repository : public manifest_provider, public version_provider {
    mutable std::mutex _mutex;

    std::map<package_identity, std::vector<semver::version>> _versions;
    std::map<std::string, package_manifest>                  _manifests;
    std::map<std::string, std::string>                       _refs;
    std::set<std::string>                                    _broken_manifests;
    std::set<package_identity>                               _broken_packages;
    std::set<package_identity>                               _foreign_failures;

    std::map<package_identity, int> _n_version_queries;
    std::map<std::string, int>      _n_manifest_queries;
    int                             _n_revision_queries = 0;

    /// Throw the failure registered for the package, if any. Requires the lock.
    void _check_reachable(const package_identity& pkg) const;

    package_manifest& _add(std::string_view                        name,
                           const package_version&                  ver,
                           std::initializer_list<std::string_view> deps);

public:
    /// Add a released version of a package, with dependencies in shorthand form
    package_manifest& add(std::string_view                        name,
                          std::string_view                        version,
                          std::initializer_list<std::string_view> deps = {});

    /**
     * @brief Add a revision of a package's repository. `ref` is a branch name that resolves to
     * `revision`. The revision also resolves to itself.
     */
    package_manifest& add_revision(std::string_view                        name,
                                   std::string_view                        ref,
                                   std::string_view                        revision,
                                   std::initializer_list<std::string_view> deps = {});

    /// Add a package found at a local path
    package_manifest& add_path(std::string_view                        name,
                               std::string_view                        path,
                               std::initializer_list<std::string_view> deps = {});

    /// Cause manifest() for the given version to throw manifest_error
    void break_manifest(std::string_view name, std::string_view version);

    /// Cause every query for the package to throw std::runtime_error
    void break_package(std::string_view name);

    /// Cause every query for the package to throw a value that is not a std::exception
    void break_package_foreign(std::string_view name);

    int n_version_queries(std::string_view name) const;
    int n_version_queries() const;
    int n_manifest_queries(std::string_view name, const package_version&) const;
    int n_manifest_queries() const;
    int n_revision_queries() const;

    depgraph::providers providers() noexcept { return {*this, *this}; }

    package_manifest manifest(const package_identity&, const package_version&) override;
    std::vector<semver::version> available_versions(const package_identity&) override;
    std::string resolve_revision(const package_identity&, std::string_view ref) override;
    std::filesystem::path checkout(const package_identity&, const package_version&) override;
};

}  // namespace depgraph::testing
