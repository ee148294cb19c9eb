#include "./manifest.hpp"

#include <neo/ufmt.hpp>

#include <algorithm>

using namespace depgraph;

std::string target_ref::to_string() const noexcept {
    return visit([](const sibling_target_ref& s) { return s.name; },
                 [](const product_ref& p) {
                     return neo::ufmt("{} (from package {})", p.product, p.package.str());
                 });
}

bool target_dependency::applies_to(std::string_view platform) const noexcept {
    return platforms.empty()
        || std::find(platforms.begin(), platforms.end(), platform) != platforms.end();
}

const target* package_manifest::find_target(std::string_view name) const noexcept {
    auto it = std::find_if(targets.begin(), targets.end(), [&](auto&& t) {
        return t.name == name;
    });
    return it == targets.end() ? nullptr : &*it;
}

const product* package_manifest::find_product(std::string_view name) const noexcept {
    auto it = std::find_if(products.begin(), products.end(), [&](auto&& p) {
        return p.name == name;
    });
    return it == products.end() ? nullptr : &*it;
}
