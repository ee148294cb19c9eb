#include "./identity.hpp"

#include <depgraph/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <ctre.hpp>

#include <algorithm>
#include <cctype>
#include <ostream>

using namespace depgraph;

namespace {

std::string_view trim_view(std::string_view s) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

}  // namespace

std::string depgraph::canonicalize_identity_string(std::string_view given) noexcept {
    auto s = trim_view(given);
    // Drop trailing separators so that "https://host/foo/" names "foo"
    while (!s.empty() && (s.back() == '/' || s.back() == '\\')) {
        s.remove_suffix(1);
    }
    auto last_sep = s.find_last_of("/\\:");
    if (last_sep != s.npos) {
        s = s.substr(last_sep + 1);
    }
    std::string ret{s};
    std::transform(ret.begin(), ret.end(), ret.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    if (last_sep != std::string_view::npos && ret.ends_with(".git")) {
        ret.erase(ret.size() - 4);
    }
    return ret;
}

package_identity package_identity::from_string(std::string_view str) {
    constexpr ctll::fixed_string identity_re = "[a-z0-9][a-z0-9._\\-]*";

    auto canon = canonicalize_identity_string(str);
    if (!ctre::match<identity_re>(canon)) {
        BOOST_LEAF_THROW_EXCEPTION(e_invalid_identity{std::string(str)});
    }
    return package_identity{std::move(canon)};
}

std::ostream& depgraph::operator<<(std::ostream& out, const package_identity& self) {
    out << self.str();
    return out;
}
