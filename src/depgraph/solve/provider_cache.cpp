#include "./provider_cache.hpp"

#include <depgraph/util/log.hpp>
#include <depgraph/util/signal.hpp>

#include <algorithm>
#include <chrono>
#include <exception>

using namespace depgraph;

namespace {

template <typename T, typename Fetch>
void fulfill(std::promise<T>& prom, Fetch&& fetch) noexcept {
    try {
        prom.set_value(fetch());
    } catch (...) {
        // Waiters receive the same exception
        prom.set_exception(std::current_exception());
    }
}

}  // namespace

provider_cache::~provider_cache() {
    std::unique_lock lk{_tasks_mutex};
    for (auto& task : _tasks) {
        task.wait();
    }
}

template <typename T>
std::pair<std::shared_future<T>, std::optional<std::promise<T>>>
provider_cache::_claim(memo_table<T>& table, const std::string& key) {
    std::unique_lock lk{table.mutex};
    auto             found = table.entries.find(key);
    if (found != table.entries.end()) {
        return {found->second, std::nullopt};
    }
    std::promise<T> prom;
    auto            fut = prom.get_future().share();
    table.entries.emplace(key, fut);
    return {fut, std::move(prom)};
}

template <typename T>
const T& provider_cache::_wait(const std::shared_future<T>& fut) const {
    using namespace std::chrono_literals;
    while (fut.wait_for(20ms) != std::future_status::ready) {
        cancellation_point(_stop);
    }
    return fut.get();
}

template <typename T, typename Fetch>
const T& provider_cache::_get(memo_table<T>& table, const std::string& key, Fetch&& fetch) {
    cancellation_point(_stop);
    auto [fut, owned] = _claim(table, key);
    if (owned) {
        fulfill(*owned, fetch);
    }
    return _wait(fut);
}

std::vector<semver::version> provider_cache::_fetch_versions(const package_identity& pkg) {
    cancellation_point(_stop);
    depgraph_log(trace, "Fetching available versions of {}", pkg.str());
    auto versions = _providers.versions.available_versions(pkg);
    std::sort(versions.begin(), versions.end());
    versions.erase(std::unique(versions.begin(), versions.end()), versions.end());
    return versions;
}

const std::vector<semver::version>&
provider_cache::available_versions(const package_identity& pkg) {
    return _get(_versions, pkg.str(), [&] { return _fetch_versions(pkg); });
}

const package_manifest& provider_cache::manifest(const package_identity& pkg,
                                                 const package_version&  ver) {
    return _get(_manifests, pkg.str() + "\n" + ver.key(), [&] {
        cancellation_point(_stop);
        depgraph_log(trace, "Loading manifest of {} {}", pkg.str(), ver.to_string());
        return _providers.manifests.manifest(pkg, ver);
    });
}

const std::string& provider_cache::resolve_revision(const package_identity& pkg,
                                                    const std::string&      ref) {
    return _get(_revisions, pkg.str() + "\n" + ref, [&] {
        cancellation_point(_stop);
        depgraph_log(trace, "Resolving revision '{}' of {}", ref, pkg.str());
        return _providers.versions.resolve_revision(pkg, ref);
    });
}

void provider_cache::prefetch_versions(const package_identity& pkg) {
    auto [fut, owned] = _claim(_versions, pkg.str());
    if (!owned) {
        return;
    }
    depgraph_log(trace, "Prefetching available versions of {}", pkg.str());
    std::unique_lock lk{_tasks_mutex};
    _tasks.push_back(std::async(std::launch::async,
                                [this, pkg, prom = std::move(*owned)]() mutable {
                                    fulfill(prom, [&] { return _fetch_versions(pkg); });
                                }));
}
