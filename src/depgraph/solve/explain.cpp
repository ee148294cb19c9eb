#include "./explain.hpp"

#include <fmt/ostream.h>

#include <set>
#include <sstream>

using namespace depgraph;

namespace {

/// Spell out a term without its polarity
std::string phrase(const term& t, const package_identity& root) {
    if (t.package == root) {
        return t.package.str();
    }
    if (t.versions.is_any()) {
        return "every version of " + t.package.str();
    }
    return t.package.str() + " " + t.versions.to_string();
}

std::string describe_derived(const incompatibility& inc, const package_identity& root) {
    auto& terms = inc.terms;
    if (inc.is_failure(root)) {
        return "version solving failed";
    }
    if (terms.size() == 1) {
        auto& t = terms.front();
        return t.positive ? phrase(t, root) + " is forbidden" : phrase(t, root) + " is required";
    }
    if (terms.size() == 2) {
        auto& a = terms.front();
        auto& b = terms.back();
        if (a.positive != b.positive) {
            auto& pos = a.positive ? a : b;
            auto& neg = a.positive ? b : a;
            return phrase(pos, root) + " requires " + phrase(neg, root);
        }
        if (a.positive) {
            return phrase(a, root) + " is incompatible with " + phrase(b, root);
        }
        return "either " + phrase(a, root) + " or " + phrase(b, root) + " is required";
    }
    std::string ret = "these cannot all hold: ";
    bool        first = true;
    for (auto& t : terms) {
        if (!first) {
            ret += ", ";
        }
        first = false;
        ret += t.positive ? phrase(t, root) : "not " + phrase(t, root);
    }
    return ret;
}

class failure_explainer {
    const incompatibility_store& _store;
    std::stringstream            _strm;
    std::set<incompatibility_id> _done;

public:
    explicit failure_explainer(const incompatibility_store& s)
        : _store(s) {}

    void explain(incompatibility_id id) {
        auto derived = _store[id].cause.get_if<cause::derived>();
        if (!derived || !_done.insert(id).second) {
            return;
        }
        explain(derived->left);
        explain(derived->right);
        fmt::print(_strm, "┌─ Because {},\n", describe_incompatibility(_store, derived->left));
        fmt::print(_strm, "│      and {},\n", describe_incompatibility(_store, derived->right));
        fmt::print(_strm, "╘═    then {}.\n", describe_incompatibility(_store, id));
    }

    std::string str() const { return _strm.str(); }
};

}  // namespace

std::string depgraph::describe_incompatibility(const incompatibility_store& store,
                                               incompatibility_id           id) {
    auto&       inc  = store[id];
    const auto& root = store.root();
    return inc.cause.visit(
        [&](const cause::root&) { return root.str() + " is the root package"; },
        [&](const cause::dependency& dep) {
            auto depender = dep.via.value_or(phrase(inc.terms.front(), root));
            if (inc.terms.size() < 2) {
                return depender + " has a dependency";
            }
            return depender + " depends on " + phrase(inc.terms.back(), root);
        },
        [&](const cause::no_versions&) {
            auto& t = inc.terms.front();
            return "no versions of " + t.package.str() + " match " + t.versions.to_string();
        },
        [&](const cause::package_not_found&) {
            return "package " + inc.terms.front().package.str() + " could not be found";
        },
        [&](const cause::unavailable& un) {
            return phrase(inc.terms.front(), root) + " has an unusable manifest (" + un.reason
                + ")";
        },
        [&](const cause::unversioned_dependency& uv) {
            return phrase(inc.terms.front(), root) + " depends on " + uv.dependency.str() + " "
                + uv.requirement + ", which only the root package may require";
        },
        [&](const cause::derived&) { return describe_derived(inc, root); });
}

std::string depgraph::explain_derivation(const incompatibility_store& store,
                                         incompatibility_id           id) {
    failure_explainer explainer{store};
    explainer.explain(id);
    auto ret = explainer.str();
    if (ret.empty()) {
        // The failure was not derived: it is a single fact
        ret = "Because " + describe_incompatibility(store, id) + ".\n";
    }
    return ret;
}
