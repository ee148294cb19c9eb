#include <depgraph/dym.hpp>

#include <catch2/catch.hpp>

#include <vector>

TEST_CASE("Basic edit distances") {
    CHECK(depgraph::lev_edit_distance("kitten", "sitting") == 3);
    CHECK(depgraph::lev_edit_distance("", "abc") == 3);
    CHECK(depgraph::lev_edit_distance("same", "same") == 0);
}

TEST_CASE("Suggest the nearest candidate") {
    std::vector<std::string> names = {"networking", "logging", "parser"};
    auto                     dym   = depgraph::did_you_mean("loging", names);
    REQUIRE(dym.has_value());
    CHECK(*dym == "logging");

    CHECK_FALSE(depgraph::did_you_mean("anything", std::vector<std::string>{}).has_value());
}

TEST_CASE("Suggest by a projected name") {
    struct named {
        std::string name;
    };
    std::vector<named> items = {{"widgets"}, {"gadgets"}};
    CHECK(depgraph::did_you_mean("widget", items, &named::name) == "widgets");
}
