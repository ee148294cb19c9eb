#include "./memory_repository.hpp"

#include <neo/ufmt.hpp>

#include <algorithm>
#include <numeric>
#include <stdexcept>

using namespace depgraph;
using namespace depgraph::testing;

namespace {

/// Revisions are found by their identifier alone, regardless of the branch that reached them
std::string manifest_key(const package_identity& pkg, const package_version& ver) {
    if (auto pin = ver.get_if<revision_pin>()) {
        return pkg.str() + "\nrevision:" + pin->revision;
    }
    return pkg.str() + "\n" + ver.key();
}

std::string ref_key(const package_identity& pkg, std::string_view ref) {
    return neo::ufmt("{}\n{}", pkg.str(), ref);
}

}  // namespace

package_manifest& memory_repository::_add(std::string_view                        name,
                                          const package_version&                  ver,
                                          std::initializer_list<std::string_view> deps) {
    auto             id = package_identity::from_string(name);
    package_manifest man{.identity = id};
    target           tgt{.name = id.str()};
    for (auto dep_str : deps) {
        auto dep = dependency::parse_shorthand(dep_str);
        tgt.dependencies.push_back(
            target_dependency{product_ref{dep.identity.str(), dep.identity}});
        man.dependencies.push_back(std::move(dep));
    }
    man.targets.push_back(std::move(tgt));
    man.products.push_back(product{id.str(), {id.str()}});

    std::unique_lock lk{_mutex};
    return _manifests.insert_or_assign(manifest_key(id, ver), std::move(man)).first->second;
}

package_manifest& memory_repository::add(std::string_view                        name,
                                         std::string_view                        version,
                                         std::initializer_list<std::string_view> deps) {
    auto ver = semver::version::parse(version);
    {
        std::unique_lock lk{_mutex};
        auto&            vers = _versions[package_identity::from_string(name)];
        vers.push_back(ver);
        std::sort(vers.begin(), vers.end());
    }
    return _add(name, ver, deps);
}

package_manifest& memory_repository::add_revision(std::string_view name,
                                                  std::string_view ref,
                                                  std::string_view revision,
                                                  std::initializer_list<std::string_view> deps) {
    auto id = package_identity::from_string(name);
    {
        std::unique_lock lk{_mutex};
        _refs[ref_key(id, ref)]      = std::string(revision);
        _refs[ref_key(id, revision)] = std::string(revision);
    }
    return _add(name, revision_pin{std::string(revision)}, deps);
}

package_manifest& memory_repository::add_path(std::string_view                        name,
                                              std::string_view                        path,
                                              std::initializer_list<std::string_view> deps) {
    return _add(name, path_requirement{path}, deps);
}

void memory_repository::break_manifest(std::string_view name, std::string_view version) {
    std::unique_lock lk{_mutex};
    _broken_manifests.insert(
        manifest_key(package_identity::from_string(name), semver::version::parse(version)));
}

void memory_repository::break_package(std::string_view name) {
    std::unique_lock lk{_mutex};
    _broken_packages.insert(package_identity::from_string(name));
}

void memory_repository::break_package_foreign(std::string_view name) {
    std::unique_lock lk{_mutex};
    _foreign_failures.insert(package_identity::from_string(name));
}

void memory_repository::_check_reachable(const package_identity& pkg) const {
    if (_foreign_failures.contains(pkg)) {
        throw 42;
    }
    if (_broken_packages.contains(pkg)) {
        throw std::runtime_error(neo::ufmt("The repository for {} is unreachable", pkg.str()));
    }
}

int memory_repository::n_version_queries(std::string_view name) const {
    std::unique_lock lk{_mutex};
    auto             found = _n_version_queries.find(package_identity::from_string(name));
    return found == _n_version_queries.end() ? 0 : found->second;
}

int memory_repository::n_version_queries() const {
    std::unique_lock lk{_mutex};
    return std::accumulate(_n_version_queries.begin(),
                           _n_version_queries.end(),
                           0,
                           [](int acc, auto&& pair) { return acc + pair.second; });
}

int memory_repository::n_manifest_queries(std::string_view       name,
                                          const package_version& ver) const {
    std::unique_lock lk{_mutex};
    auto found = _n_manifest_queries.find(manifest_key(package_identity::from_string(name), ver));
    return found == _n_manifest_queries.end() ? 0 : found->second;
}

int memory_repository::n_manifest_queries() const {
    std::unique_lock lk{_mutex};
    return std::accumulate(_n_manifest_queries.begin(),
                           _n_manifest_queries.end(),
                           0,
                           [](int acc, auto&& pair) { return acc + pair.second; });
}

int memory_repository::n_revision_queries() const {
    std::unique_lock lk{_mutex};
    return _n_revision_queries;
}

package_manifest memory_repository::manifest(const package_identity& pkg,
                                             const package_version&  ver) {
    std::unique_lock lk{_mutex};
    auto             key = manifest_key(pkg, ver);
    ++_n_manifest_queries[key];
    _check_reachable(pkg);
    if (_broken_manifests.contains(key)) {
        throw manifest_error(
            neo::ufmt("The manifest of {} {} is malformed", pkg.str(), ver.to_string()));
    }
    auto found = _manifests.find(key);
    if (found == _manifests.end()) {
        throw manifest_error(
            neo::ufmt("There is no manifest for {} {}", pkg.str(), ver.to_string()));
    }
    return found->second;
}

std::vector<semver::version> memory_repository::available_versions(const package_identity& pkg) {
    std::unique_lock lk{_mutex};
    ++_n_version_queries[pkg];
    _check_reachable(pkg);
    auto found = _versions.find(pkg);
    if (found == _versions.end()) {
        return {};
    }
    return found->second;
}

std::string memory_repository::resolve_revision(const package_identity& pkg,
                                                std::string_view        ref) {
    std::unique_lock lk{_mutex};
    ++_n_revision_queries;
    _check_reachable(pkg);
    auto found = _refs.find(ref_key(pkg, ref));
    if (found == _refs.end()) {
        throw std::runtime_error(
            neo::ufmt("Cannot resolve '{}' in the repository of {}", ref, pkg.str()));
    }
    return found->second;
}

std::filesystem::path memory_repository::checkout(const package_identity& pkg,
                                                  const package_version&  ver) {
    if (auto p = ver.get_if<path_requirement>()) {
        return p->path;
    }
    return std::filesystem::path("/checkouts") / pkg.str() / ver.to_string();
}
