#include "./lockfile.hpp"

#include <depgraph/error/on_error.hpp>
#include <depgraph/error/try_catch.hpp>
#include <depgraph/util/fs/io.hpp>
#include <depgraph/util/json5/parse.hpp>
#include <depgraph/util/json_walk.hpp>
#include <depgraph/util/log.hpp>
#include <depgraph/util/parse_enum.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/assert.hpp>
#include <neo/ufmt.hpp>
#include <nlohmann/json.hpp>

#include <iterator>
#include <vector>

using namespace depgraph;
using namespace depgraph::walk_utils;

namespace {

using pin_pair = std::pair<package_identity, package_version>;

struct pin_data {
    std::optional<package_identity> identity;
    std::optional<requirement_kind> kind;
    std::optional<semver::version>  version;
    std::optional<std::string>      branch;
    std::optional<std::string>      revision;
    std::optional<std::string>      requested;
};

pin_pair pin_from_data(const json5::data& data) {
    pin_data        pin;
    key_dym_tracker dym{{"identity", "kind", "version", "branch", "revision", "requested"}};

    walk(data,
         require_mapping{"Each lockfile pin must be a JSON object"},
         mapping{
             dym.mark_seen(),
             required_key{"identity",
                          "A pin must have an 'identity' string",
                          require_str{"A pin 'identity' must be a string"},
                          put_into{pin.identity, identity_from_string{}}},
             required_key{"kind",
                          "A pin must have a 'kind' string",
                          require_str{"A pin 'kind' must be a string"},
                          put_into{pin.kind, enum_from_string<requirement_kind>{}}},
             if_key{"version",
                    require_str{"A pin 'version' must be a string"},
                    put_into{pin.version, version_from_string{}}},
             if_key{"branch",
                    require_str{"A pin 'branch' must be a string"},
                    put_into{pin.branch, take_string{}}},
             if_key{"revision",
                    require_str{"A pin 'revision' must be a string"},
                    put_into{pin.revision, take_string{}}},
             if_key{"requested",
                    require_str{"A pin 'requested' must be a string"},
                    put_into{pin.requested, take_string{}}},
             dym.reject_unknown<e_bad_lockfile_key>(),
         });

    const auto& id   = *pin.identity;
    const auto  kind = *pin.kind;
    auto need = [&](auto& opt, std::string_view key) -> decltype(auto) {
        if (!opt.has_value()) {
            throw semester::walk_error{neo::ufmt("The '{}' pin of '{}' must have a '{}' string",
                                                 enum_str(kind),
                                                 id.str(),
                                                 key)};
        }
        return *opt;
    };
    auto forbid = [&](auto& opt, std::string_view key) {
        if (opt.has_value()) {
            throw semester::walk_error{neo::ufmt("The '{}' pin of '{}' may not have a '{}' key",
                                                 enum_str(kind),
                                                 id.str(),
                                                 key)};
        }
    };

    switch (kind) {
    case requirement_kind::version:
        forbid(pin.branch, "branch");
        forbid(pin.revision, "revision");
        forbid(pin.requested, "requested");
        return {id, need(pin.version, "version")};
    case requirement_kind::branch:
        forbid(pin.version, "version");
        forbid(pin.requested, "requested");
        return {id, revision_pin{need(pin.revision, "revision"), need(pin.branch, "branch")}};
    case requirement_kind::revision:
        forbid(pin.version, "version");
        forbid(pin.branch, "branch");
        return {id, revision_pin{need(pin.revision, "revision"), std::nullopt, pin.requested}};
    case requirement_kind::path:
        throw semester::walk_error{
            neo::ufmt("Package '{}' is pinned to a local path, which cannot be locked", id.str())};
    }
    neo::unreachable();
}

}  // namespace

lockfile lockfile::from_solution(const solution& sln) noexcept {
    lockfile ret;
    for (auto& [id, ver] : sln) {
        if (ver.is<path_requirement>()) {
            continue;
        }
        ret._pins.emplace(id, ver);
    }
    return ret;
}

lockfile lockfile::from_json_data(const json5::data& data) {
    return depgraph_leaf_try {
        if (!data.is_object()) {
            throw semester::walk_error{"Root of a lockfile must be a JSON object"};
        }
        auto schema_version = data.as_object().find("schema-version");
        if (schema_version == data.as_object().cend()) {
            throw semester::walk_error{"A 'schema-version' integer is required"};
        }
        if (!schema_version->second.is_number() || schema_version->second.as_number() != 1) {
            throw semester::walk_error{"Only 'schema-version' == 1 is supported"};
        }

        std::vector<pin_pair> pins;
        key_dym_tracker       dym{{"pins", "schema-version"}};
        walk(data,
             require_mapping{"Root of a lockfile must be a JSON object"},
             mapping{
                 dym.mark_seen(),
                 required_key{"pins",
                              "A 'pins' array is required",
                              require_array{"'pins' must be an array of pin objects"},
                              for_each{put_into{std::back_inserter(pins), pin_from_data}}},
                 if_key{"schema-version", just_accept},
                 dym.reject_unknown<e_bad_lockfile_key>(),
             });

        lockfile ret;
        for (auto& [id, ver] : pins) {
            if (!ret._pins.emplace(id, ver).second) {
                throw semester::walk_error{
                    neo::ufmt("Package '{}' is pinned more than once", id.str())};
            }
        }
        return ret;
    }
    depgraph_leaf_catch(catch_<semester::walk_error> e)->noreturn_t {
        BOOST_LEAF_THROW_EXCEPTION(e.matched, e_invalid_lockfile{e.matched.what()});
    }
    depgraph_leaf_catch(const semver::invalid_version& e)->noreturn_t {
        BOOST_LEAF_THROW_EXCEPTION(
            e_invalid_lockfile{neo::ufmt("Invalid semantic version string '{}'", e.string())});
    }
    depgraph_leaf_catch(e_invalid_identity id)->noreturn_t {
        current_error().load(
            e_invalid_lockfile{neo::ufmt("Invalid package identity '{}'", id.value)});
        throw;
    }
    depgraph_leaf_catch(e_invalid_enum_str kind)->noreturn_t {
        current_error().load(e_invalid_lockfile{neo::ufmt("Invalid pin kind '{}'", kind.value)});
        throw;
    }
    depgraph_leaf_catch(const e_bad_lockfile_key& key)->noreturn_t {
        current_error().load(e_invalid_lockfile{neo::ufmt("Unknown lockfile key '{}'", key.given)});
        throw;
    };
}

lockfile lockfile::from_json_str(std::string_view content) {
    return depgraph_leaf_try { return from_json_data(parse_json5_str(content)); }
    depgraph_leaf_catch(e_json_parse_error err)->noreturn_t {
        current_error().load(e_invalid_lockfile{err.value});
        throw;
    };
}

lockfile lockfile::load(const std::filesystem::path& fpath) {
    DEPGRAPH_E_SCOPE(e_read_file_path{fpath});
    auto ret = from_json_str(read_file(fpath));
    depgraph_log(debug, "Loaded {} pins from [{}]", ret._pins.size(), fpath.string());
    return ret;
}

std::optional<lockfile> lockfile::load_if_exists(const std::filesystem::path& fpath) {
    if (!std::filesystem::exists(fpath)) {
        depgraph_log(debug, "There is no lockfile at [{}]", fpath.string());
        return std::nullopt;
    }
    return load(fpath);
}

const package_version* lockfile::find(const package_identity& id) const noexcept {
    auto found = _pins.find(id);
    return found == _pins.end() ? nullptr : &found->second;
}

std::string lockfile::to_json() const noexcept {
    using json = nlohmann::ordered_json;
    json pins  = json::array();
    for (auto& [id, ver] : _pins) {
        json pin = json::object({
            {"identity", id.str()},
            {"kind", std::string(enum_str(ver.kind()))},
        });
        ver.visit([&](const semver::version& v) { pin["version"] = v.to_string(); },
                  [&](const revision_pin& r) {
                      if (r.branch) {
                          pin["branch"] = *r.branch;
                      }
                      pin["revision"] = r.revision;
                      if (r.requested) {
                          pin["requested"] = *r.requested;
                      }
                  },
                  [&](const path_requirement& p) {
                      neo_assert_always(invariant,
                                        false,
                                        "A local path package was pinned in a lockfile",
                                        id.str(),
                                        p.path.string());
                  });
        pins.push_back(std::move(pin));
    }
    json data = json::object({
        {"pins", std::move(pins)},
        {"schema-version", 1},
    });
    return data.dump(2) + "\n";
}

void lockfile::save(const std::filesystem::path& fpath) const {
    depgraph_log(debug, "Writing {} pins to [{}]", _pins.size(), fpath.string());
    write_file_atomic(fpath, to_json());
    depgraph_log(info, "Updated lockfile [{}]", fpath.string());
}
