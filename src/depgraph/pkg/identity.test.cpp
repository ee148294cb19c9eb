#include "./identity.hpp"

#include <catch2/catch.hpp>

#include <depgraph/error/try_catch.hpp>

using depgraph::package_identity;

TEST_CASE("Canonicalize identities") {
    struct case_ {
        std::string_view given;
        std::string_view expect;
    };

    auto [given, expect] = GENERATE(Catch::Generators::values<case_>({
        {"foo", "foo"},
        {"Foo", "foo"},
        {"  foo  ", "foo"},
        {"https://github.com/Org/Foo.git", "foo"},
        {"https://github.com/org/foo", "foo"},
        {"git@github.com:org/swift-nio.git", "swift-nio"},
        {"/home/me/src/MyLib/", "mylib"},
        {"lib.git", "lib.git"},
    }));
    CHECK(package_identity::from_string(given).str() == expect);
}

TEST_CASE("The same package by name and by URL") {
    CHECK(package_identity::from_string("https://example.com/A/Widgets.git")
          == package_identity::from_string("widgets"));
}

TEST_CASE("Reject invalid identities") {
    auto given = GENERATE(Catch::Generators::values<std::string_view>({
        "",
        "   ",
        "-foo",
        "foo bar",
        "foo&bar",
        ".hidden",
    }));
    CAPTURE(given);
    depgraph_leaf_try {
        (void)package_identity::from_string(given);
        FAIL("Expected a failure, but no failure occurred");
    }
    depgraph_leaf_catch(depgraph::e_invalid_identity e) { CHECK(e.value == given); }
    depgraph_leaf_catch_all { FAIL_CHECK("Unexpected error: " << diagnostic_info); };
}
