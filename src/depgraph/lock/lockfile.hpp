#pragma once

#include <depgraph/solve/solve.hpp>

#include <json5/data.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace depgraph {

/// The content of a lockfile is not a valid lockfile
struct e_invalid_lockfile {
    std::string value;
};

/// A lockfile pin contains a key that is not understood
struct e_bad_lockfile_key {
    std::string                given;
    std::optional<std::string> nearest;
};

/**
 * @brief The versions chosen by a prior resolution, recorded so that later resolutions can
 * repeat them.
 *
 * Released versions and repository revisions are pinned. Packages taken from a local directory
 * are never pinned.
 */
class lockfile {
    std::map<package_identity, package_version> _pins;

public:
    lockfile() = default;

    /// Pin every version of the solution that is not a local directory
    [[nodiscard]] static lockfile from_solution(const solution&) noexcept;

    /**
     * @brief Parse and validate lockfile JSON data. Throws e_invalid_lockfile (with a
     * semester::walk_error where the structure is wrong) on bad content.
     */
    [[nodiscard]] static lockfile from_json_data(const json5::data&);
    [[nodiscard]] static lockfile from_json_str(std::string_view);

    /// Load the lockfile at the given path
    [[nodiscard]] static lockfile load(const std::filesystem::path&);
    /// Load the lockfile at the given path, if one exists
    [[nodiscard]] static std::optional<lockfile> load_if_exists(const std::filesystem::path&);

    const auto& pins() const noexcept { return _pins; }
    bool        empty() const noexcept { return _pins.empty(); }

    /// The pin of the given package, or nullptr if it is not pinned
    const package_version* find(const package_identity&) const noexcept;

    /**
     * @brief Render the lockfile as JSON. Pins are sorted by identity, so equal lockfiles
     * always render identically.
     */
    std::string to_json() const noexcept;

    /// Write the lockfile JSON to the given path atomically
    void save(const std::filesystem::path&) const;

    friend bool operator==(const lockfile&, const lockfile&) noexcept = default;
};

}  // namespace depgraph
