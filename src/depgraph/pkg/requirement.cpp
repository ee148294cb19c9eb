#include "./requirement.hpp"

#include <depgraph/error/human.hpp>
#include <depgraph/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>
#include <neo/utility.hpp>

#include <cctype>
#include <type_traits>

using namespace depgraph;

requirement_kind requirement::kind() const noexcept {
    return visit([](const version_range_set&) { return requirement_kind::version; },
                 [](const branch_requirement&) { return requirement_kind::branch; },
                 [](const revision_requirement&) { return requirement_kind::revision; },
                 [](const path_requirement&) { return requirement_kind::path; });
}

std::string requirement::to_string() const noexcept {
    return visit([](const version_range_set& v) { return v.to_string(); },
                 [](const branch_requirement& b) { return "branch=" + b.name; },
                 [](const revision_requirement& r) { return "revision=" + r.id; },
                 [](const path_requirement& p) { return "path=" + p.path.generic_string(); });
}

bool depgraph::operator==(const requirement& lhs, const requirement& rhs) noexcept {
    if (lhs.index() != rhs.index()) {
        return false;
    }
    return lhs.visit([&](const auto& l) {
        using T = std::remove_cvref_t<decltype(l)>;
        return l == rhs.as<T>();
    });
}

namespace {

std::string_view next_token(std::string_view sv) noexcept {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!sv.empty() && is_space(sv.front())) {
        sv.remove_prefix(1);
    }
    auto it = sv.begin();
    while (it != sv.end() && !is_space(*it)) {
        ++it;
    }
    return sv.substr(0, static_cast<std::size_t>(it - sv.begin()));
}

version_range_set parse_range_shorthand(char sep, std::string_view range_str) {
    switch (sep) {
    case '@':
    case '^':
        if (!range_str.empty() && (range_str.front() == '[' || range_str.front() == '(')) {
            return version_range_set::parse_interval(range_str);
        }
        return version_range_set::up_to_next_major(semver::version::parse(range_str));
    case '~':
        return version_range_set::up_to_next_minor(semver::version::parse(range_str));
    case '=':
        return version_range_set::exactly(semver::version::parse(range_str));
    case '+':
        return version_range_set::at_least(semver::version::parse(range_str));
    }
    BOOST_LEAF_THROW_EXCEPTION(
        e_human_message{neo::ufmt("Unknown version range separator '{}'", sep)});
}

}  // namespace

dependency dependency::parse_shorthand(const std::string_view sv) {
    DEPGRAPH_E_SCOPE(e_parse_dependency_string{std::string(sv)});
    std::string_view remain    = sv;
    std::string_view tok       = remain.substr(0, 0);
    auto             adv_token = [&] {
        remain.remove_prefix(static_cast<std::size_t>(tok.data() - remain.data()));
        remain.remove_prefix(tok.size());
        return tok = next_token(remain);
    };

    adv_token();
    if (tok.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(e_human_message{"Invalid empty dependency specifier"});
    }

    auto sep_pos = tok.find_first_of("=@^~+");
    if (sep_pos != tok.npos) {
        auto name = tok.substr(0, sep_pos);
        auto rng  = parse_range_shorthand(tok[sep_pos], tok.substr(sep_pos + 1));
        if (!adv_token().empty()) {
            BOOST_LEAF_THROW_EXCEPTION(e_human_message{
                neo::ufmt("Unexpected trailing string in dependency string \"{}\"", remain)});
        }
        return dependency{package_identity::from_string(name), std::move(rng)};
    }

    auto identity = package_identity::from_string(tok);
    adv_token();
    if (tok.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(e_human_message{
            "Expected one of '=@^~+' in name+version shorthand, or one of 'branch=', "
            "'revision=', or 'path=' following the package name"});
    }

    auto eq_pos = tok.find('=');
    if (eq_pos == tok.npos || eq_pos + 1 == tok.size()) {
        BOOST_LEAF_THROW_EXCEPTION(
            e_human_message{neo::ufmt("Expected 'key=value' after the package name (Got '{}')",
                                      tok)});
    }
    auto key   = tok.substr(0, eq_pos);
    auto value = std::string(tok.substr(eq_pos + 1));
    if (key != neo::oper::any_of("branch", "revision", "path")) {
        BOOST_LEAF_THROW_EXCEPTION(e_human_message{
            neo::ufmt("Expected 'branch', 'revision', or 'path' (Got '{}')", key)});
    }

    dependency ret{identity, version_range_set::any()};
    if (key == "branch") {
        ret.requirement = branch_requirement{value};
    } else if (key == "revision") {
        ret.requirement = revision_requirement{value};
    } else {
        ret.requirement = path_requirement{value};
    }

    if (!adv_token().empty()) {
        BOOST_LEAF_THROW_EXCEPTION(e_human_message{
            neo::ufmt("Unexpected trailing string in dependency string \"{}\"", remain)});
    }
    return ret;
}

std::string dependency::to_string() const noexcept {
    return neo::ufmt("{} {}", identity.str(), requirement.to_string());
}
