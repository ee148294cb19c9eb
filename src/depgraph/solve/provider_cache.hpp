#pragma once

#include <depgraph/pkg/provider.hpp>

#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace depgraph {

/**
 * @brief Memoizes queries made to the package providers during a single resolution.
 *
 * Each distinct query is sent to the provider at most once. The first caller performs the
 * fetch, and any concurrent caller of the same query waits for that result. Failures are
 * memoized along with successes: a query that threw will rethrow the same exception to every
 * caller.
 *
 * Every wait observes cancellation, either by the given stop token or by the process-wide
 * signal flag, and throws user_cancelled.
 *
 * Outstanding prefetch tasks are joined when the cache is destroyed.
 */
class provider_cache {
    template <typename T>
    struct memo_table {
        std::mutex                                   mutex;
        std::map<std::string, std::shared_future<T>> entries;
    };

    depgraph::providers _providers;
    std::stop_token     _stop;

    memo_table<std::vector<semver::version>> _versions;
    memo_table<package_manifest>             _manifests;
    memo_table<std::string>                  _revisions;

    std::mutex                     _tasks_mutex;
    std::vector<std::future<void>> _tasks;

    template <typename T>
    std::pair<std::shared_future<T>, std::optional<std::promise<T>>>
    _claim(memo_table<T>& table, const std::string& key);

    template <typename T>
    const T& _wait(const std::shared_future<T>& fut) const;

    template <typename T, typename Fetch>
    const T& _get(memo_table<T>& table, const std::string& key, Fetch&& fetch);

    std::vector<semver::version> _fetch_versions(const package_identity&);

public:
    explicit provider_cache(depgraph::providers p, std::stop_token stop = {}) noexcept
        : _providers(p)
        , _stop(std::move(stop)) {}

    ~provider_cache();

    provider_cache(const provider_cache&) = delete;
    provider_cache& operator=(const provider_cache&) = delete;

    /// The released versions of the package, in ascending order
    const std::vector<semver::version>& available_versions(const package_identity&);

    /// The manifest of the given package version. Throws manifest_error if it is unusable.
    const package_manifest& manifest(const package_identity&, const package_version&);

    /// Resolve a branch or revision of the package to a concrete revision
    const std::string& resolve_revision(const package_identity&, const std::string& ref);

    /**
     * @brief Begin fetching the available versions of the package on a background thread,
     * unless that query has already been made.
     */
    void prefetch_versions(const package_identity&);

    const std::stop_token& stop_token() const noexcept { return _stop; }
};

}  // namespace depgraph
