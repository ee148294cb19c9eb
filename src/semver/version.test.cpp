#include "./version.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Parsing") {
    auto v1 = semver::version::parse("1.2.3");
    CHECK(v1.major == 1);
    CHECK(v1.minor == 2);
    CHECK(v1.patch == 3);
    CHECK(v1.to_string() == "1.2.3");

    v1 = semver::version::parse("1.2.3-beta.2+exp.sha.5114f85");
    CHECK(v1.is_prerelease());
    CHECK(semver::join_idents(v1.prerelease) == "beta.2");
    CHECK(semver::join_idents(v1.build_metadata) == "exp.sha.5114f85");
    CHECK(v1.to_string() == "1.2.3-beta.2+exp.sha.5114f85");

    v1 = semver::version::parse("1.0.0+001");
    CHECK_FALSE(v1.is_prerelease());
}

TEST_CASE("Parse repository tags") {
    struct case_ {
        std::string_view tag;
        std::string_view expect;
    };
    auto [tag, expect] = GENERATE(Catch::Generators::values<case_>({
        {"v1.2.3", "1.2.3"},
        {"1.2", "1.2.0"},
        {"V4", "4.0.0"},
        {"v2.0-rc.1", "2.0.0-rc.1"},
        {"0.9.12", "0.9.12"},
    }));
    INFO("Parsing tag '" << tag << "'");
    CHECK(semver::version::parse_tag(tag).to_string() == expect);
}

TEST_CASE("Compare versions") {
    using semver::order;
    struct case_ {
        std::string_view lhs;
        std::string_view rhs;
        order            expect_ord;
    };

    case_ cases[] = {
        {"1.2.3", "1.2.3", order::equivalent},
        {"1.2.3-alpha", "1.2.3", order::less},
        {"1.2.3-alpha.1", "1.2.3-beta", order::less},
        {"1.2.3-alpha.10", "1.2.3-alpha.9", order::greater},
        {"1.2.3-alpha", "1.2.3-alpha.1", order::less},
        {"1.2.3-1", "1.2.3-alpha", order::less},
        {"1.10.0", "1.9.0", order::greater},
        {"1.2.1", "1.2.1+foo", order::equivalent},
    };

    for (auto [lhs, rhs, exp] : cases) {
        INFO("Compare version '" << lhs << "' to '" << rhs << "'");
        CHECK(semver::compare(semver::version::parse(lhs), semver::version::parse(rhs)) == exp);
    }
}

TEST_CASE("Next releases") {
    auto v = semver::version::parse("1.4.7-beta");
    CHECK(v.next_major().to_string() == "2.0.0");
    CHECK(v.next_minor().to_string() == "1.5.0");
    CHECK(v.next_patch().to_string() == "1.4.8");

    auto largest = semver::version::parse("2147483646.2147483646.2147483646");
    CHECK(largest.next_major().to_string() == "2147483647.0.0");
    CHECK(largest.next_patch().to_string() == "2147483646.2147483646.2147483647");
}

TEST_CASE("Invalid versions") {
    struct invalid_version {
        std::string str;
        int         bad_offset;
    };
    invalid_version versions[] = {
        {"", 0},
        {"1.", 2},
        {"1.2", 3},
        {"1.e", 2},
        {"lol", 0},
        {"01.2.3", 0},
        {"1.2.5-", 6},
        {"1.2.5-02", 6},
        {"1.2.3-1..3", 6},
        {"1.2.3 ", 5},
        {"2147483647.0.0", 0},
        {"1.2147483647.0", 2},
        {"1.2.99999999999", 4},
    };
    for (auto&& [str, bad_offset] : versions) {
        INFO("Checking for failure while parsing bad version string '" << str << "'");
        try {
            auto ver = semver::version::parse(str);
            FAIL_CHECK("Parsing didn't throw! Produced version: " << ver.to_string());
        } catch (const semver::invalid_version& e) {
            CHECK(e.offset() == bad_offset);
        }
    }
}
