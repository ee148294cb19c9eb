#pragma once

#include <depgraph/dym.hpp>
#include <depgraph/util/parse_enum.hpp>

#include <boost/leaf/exception.hpp>
#include <json5/data.hpp>
#include <neo/assert.hpp>
#include <semester/walk.hpp>

#include <initializer_list>
#include <ranges>
#include <set>
#include <string>
#include <string_view>

namespace semver {
struct version;
}

namespace depgraph {
class package_identity;
}

namespace depgraph::walk_utils {

using namespace semester::walk_ops;
using semester::walk_error;

using require_mapping = semester::require_type<json5::data::mapping_type>;
using require_array   = semester::require_type<json5::data::array_type>;
using require_str     = semester::require_type<std::string>;

/// Conversions for use with `put_into`. Each throws the error of the underlying parser.
struct identity_from_string {
    package_identity operator()(std::string s) const;
};

struct version_from_string {
    semver::version operator()(std::string s) const;
};

template <typename Enum>
struct enum_from_string {
    Enum operator()(std::string s) const { return parse_enum_str<Enum>(s); }
};

struct take_string {
    std::string operator()(std::string s) const noexcept { return s; }
};

/**
 * @brief Checks the keys of a mapping against a fixed set of expected keys.
 *
 * Place `mark_seen()` first in a `mapping{}` and `reject_unknown<E>()` last. An unexpected key
 * throws `E{key, nearest}`, where `nearest` is the closest expected key not already given.
 */
class key_dym_tracker {
    std::set<std::string_view, std::less<>> _expected;
    std::set<std::string, std::less<>>      _seen;

public:
    key_dym_tracker(std::initializer_list<std::string_view> expected)
        : _expected(expected) {}

    auto mark_seen() {
        return [this](auto&& key, auto&&) {
            _seen.emplace(std::string(key));
            return walk.pass;
        };
    }

    template <typename E>
    auto reject_unknown() {
        return [this](auto&& key, auto&&) -> semester::walk_result {
            auto not_given
                = _expected | std::views::filter([&](auto k) { return !_seen.contains(k); });
            BOOST_LEAF_THROW_EXCEPTION(E{std::string(key), did_you_mean(key, not_given)});
            neo::unreachable();
        };
    }
};

}  // namespace depgraph::walk_utils
