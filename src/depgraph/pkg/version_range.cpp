#include "./version_range.hpp"

#include <depgraph/error/human.hpp>
#include <depgraph/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <algorithm>
#include <cctype>

using namespace depgraph;

namespace {

int compare_low(const lower_bound& a, const lower_bound& b) noexcept {
    if (a.unbounded() || b.unbounded()) {
        return int(b.unbounded()) - int(a.unbounded());
    }
    if (*a.version < *b.version) {
        return -1;
    } else if (*a.version > *b.version) {
        return 1;
    } else if (a.inclusive == b.inclusive) {
        return 0;
    }
    // An inclusive bound begins before an exclusive one on the same version
    return a.inclusive ? -1 : 1;
}

int compare_high(const upper_bound& a, const upper_bound& b) noexcept {
    if (a.unbounded() || b.unbounded()) {
        return int(a.unbounded()) - int(b.unbounded());
    }
    if (*a.version < *b.version) {
        return -1;
    } else if (*a.version > *b.version) {
        return 1;
    } else if (a.inclusive == b.inclusive) {
        return 0;
    }
    return a.inclusive ? 1 : -1;
}

/// Check whether an interval starting at `low` overlaps or abuts one that ends at `high`
bool touches(const upper_bound& high, const lower_bound& low) noexcept {
    if (high.unbounded() || low.unbounded()) {
        return true;
    }
    if (*low.version < *high.version) {
        return true;
    }
    return *low.version == *high.version && (low.inclusive || high.inclusive);
}

bool bounds_equal(const lower_bound& a, const lower_bound& b) noexcept {
    return compare_low(a, b) == 0;
}

bool bounds_equal(const upper_bound& a, const upper_bound& b) noexcept {
    return compare_high(a, b) == 0;
}

std::string_view trim_view(std::string_view s) noexcept {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

bool version_interval::contains(const semver::version& v) const noexcept {
    const bool above_low
        = low.unbounded() || *low.version < v || (low.inclusive && *low.version == v);
    const bool below_high
        = high.unbounded() || v < *high.version || (high.inclusive && v == *high.version);
    return above_low && below_high;
}

bool version_interval::empty() const noexcept {
    if (low.unbounded() || high.unbounded()) {
        return false;
    }
    if (*low.version > *high.version) {
        return true;
    }
    return *low.version == *high.version && !(low.inclusive && high.inclusive);
}

std::string version_interval::to_string() const noexcept {
    if (low.unbounded() && high.unbounded()) {
        return "*";
    }
    if (!low.unbounded() && !high.unbounded() && low.inclusive && high.inclusive
        && *low.version == *high.version) {
        return low.version->to_string();
    }
    std::string ret;
    if (!low.unbounded()) {
        ret += low.inclusive ? ">=" : ">";
        ret += low.version->to_string();
    }
    if (!high.unbounded()) {
        if (!ret.empty()) {
            ret += " ";
        }
        ret += high.inclusive ? "<=" : "<";
        ret += high.version->to_string();
    }
    return ret;
}

version_range_set::version_range_set(std::vector<version_interval> ivs) noexcept
    : _intervals(std::move(ivs)) {
    _normalize();
}

void version_range_set::_normalize() noexcept {
    std::erase_if(_intervals, [](const version_interval& iv) { return iv.empty(); });
    for (auto& iv : _intervals) {
        // Inclusivity is meaningless on an infinite bound
        if (iv.low.unbounded()) {
            iv.low.inclusive = false;
        }
        if (iv.high.unbounded()) {
            iv.high.inclusive = false;
        }
    }
    std::sort(_intervals.begin(), _intervals.end(), [](const auto& a, const auto& b) {
        return compare_low(a.low, b.low) < 0;
    });
    std::vector<version_interval> merged;
    for (auto& iv : _intervals) {
        if (!merged.empty() && touches(merged.back().high, iv.low)) {
            if (compare_high(iv.high, merged.back().high) > 0) {
                merged.back().high = iv.high;
            }
            continue;
        }
        merged.push_back(std::move(iv));
    }
    _intervals = std::move(merged);
}

version_range_set version_range_set::any() noexcept {
    return version_range_set{{version_interval{}}};
}

version_range_set version_range_set::exactly(const semver::version& v) noexcept {
    return version_range_set{{version_interval{{v, true}, {v, true}}}};
}

version_range_set version_range_set::between(const semver::version& low,
                                             const semver::version& high) noexcept {
    return version_range_set{{version_interval{{low, true}, {high, false}}}};
}

version_range_set version_range_set::at_least(const semver::version& low) noexcept {
    return version_range_set{{version_interval{{low, true}, {}}}};
}

version_range_set version_range_set::up_to_next_major(const semver::version& v) noexcept {
    return between(v, v.next_major());
}

version_range_set version_range_set::up_to_next_minor(const semver::version& v) noexcept {
    return between(v, v.next_minor());
}

version_range_set version_range_set::parse_interval(std::string_view const given) {
    DEPGRAPH_E_SCOPE(e_human_message{neo::ufmt("Invalid version interval '{}'", given)});
    auto str = trim_view(given);
    if (str.size() < 3) {
        BOOST_LEAF_THROW_EXCEPTION(
            e_human_message{"A version interval must be written as '[low,high)'"});
    }
    const char open  = str.front();
    const char close = str.back();
    if ((open != '[' && open != '(') || (close != ']' && close != ')')) {
        BOOST_LEAF_THROW_EXCEPTION(e_human_message{
            "A version interval must begin with '[' or '(' and end with ']' or ')'"});
    }
    auto inner = str.substr(1, str.size() - 2);
    auto comma = inner.find(',');
    if (comma == inner.npos) {
        BOOST_LEAF_THROW_EXCEPTION(
            e_human_message{"Expected a comma between the bounds of a version interval"});
    }
    auto low_str  = trim_view(inner.substr(0, comma));
    auto high_str = trim_view(inner.substr(comma + 1));

    version_interval iv;
    if (!low_str.empty()) {
        iv.low = {semver::version::parse(low_str), open == '['};
    }
    if (!high_str.empty()) {
        iv.high = {semver::version::parse(high_str), close == ']'};
    }
    if (iv.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(e_human_message{"The version interval contains no versions"});
    }
    return version_range_set{{iv}};
}

bool version_range_set::is_any() const noexcept {
    return _intervals.size() == 1 && _intervals.front().low.unbounded()
        && _intervals.front().high.unbounded();
}

bool version_range_set::contains(const semver::version& v) const noexcept {
    return std::any_of(_intervals.begin(), _intervals.end(), [&](auto&& iv) {
        return iv.contains(v);
    });
}

bool version_range_set::contains(const version_range_set& other) const noexcept {
    return other.difference(*this).empty();
}

bool version_range_set::disjoint(const version_range_set& other) const noexcept {
    return intersection(other).empty();
}

std::optional<semver::version> version_range_set::sole_version() const noexcept {
    if (_intervals.size() != 1) {
        return std::nullopt;
    }
    auto& iv = _intervals.front();
    if (iv.low.unbounded() || iv.high.unbounded() || !iv.low.inclusive || !iv.high.inclusive
        || *iv.low.version != *iv.high.version) {
        return std::nullopt;
    }
    return *iv.low.version;
}

version_range_set version_range_set::intersection(const version_range_set& other) const noexcept {
    std::vector<version_interval> ret;
    auto                          a = _intervals.cbegin();
    auto                          b = other._intervals.cbegin();
    while (a != _intervals.cend() && b != other._intervals.cend()) {
        version_interval iv{
            compare_low(a->low, b->low) >= 0 ? a->low : b->low,
            compare_high(a->high, b->high) <= 0 ? a->high : b->high,
        };
        if (!iv.empty()) {
            ret.push_back(std::move(iv));
        }
        if (compare_high(a->high, b->high) < 0) {
            ++a;
        } else {
            ++b;
        }
    }
    return version_range_set{std::move(ret)};
}

version_range_set version_range_set::union_(const version_range_set& other) const noexcept {
    auto ivs = _intervals;
    ivs.insert(ivs.end(), other._intervals.begin(), other._intervals.end());
    return version_range_set{std::move(ivs)};
}

version_range_set version_range_set::difference(const version_range_set& other) const noexcept {
    return intersection(other.complement());
}

version_range_set version_range_set::complement() const noexcept {
    if (_intervals.empty()) {
        return any();
    }
    std::vector<version_interval> ret;
    lower_bound                   gap_start;
    for (auto& iv : _intervals) {
        if (!iv.low.unbounded()) {
            ret.push_back(version_interval{gap_start, {iv.low.version, !iv.low.inclusive}});
        }
        if (iv.high.unbounded()) {
            return version_range_set{std::move(ret)};
        }
        gap_start = lower_bound{iv.high.version, !iv.high.inclusive};
    }
    ret.push_back(version_interval{gap_start, {}});
    return version_range_set{std::move(ret)};
}

std::string version_range_set::to_string() const noexcept {
    if (_intervals.empty()) {
        return "(none)";
    }
    std::string ret;
    for (auto& iv : _intervals) {
        if (!ret.empty()) {
            ret += " || ";
        }
        ret += iv.to_string();
    }
    return ret;
}

bool depgraph::operator==(const version_range_set& lhs, const version_range_set& rhs) noexcept {
    return std::equal(lhs._intervals.begin(),
                      lhs._intervals.end(),
                      rhs._intervals.begin(),
                      rhs._intervals.end(),
                      [](const version_interval& a, const version_interval& b) {
                          return bounds_equal(a.low, b.low) && bounds_equal(a.high, b.high);
                      });
}
