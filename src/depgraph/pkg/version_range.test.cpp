#include "./version_range.hpp"

#include <catch2/catch.hpp>

using depgraph::version_range_set;

namespace {

semver::version v(std::string_view s) { return semver::version::parse(s); }

version_range_set iv(std::string_view s) { return version_range_set::parse_interval(s); }

}  // namespace

TEST_CASE("Parse interval notation") {
    auto rng = iv("[1.0.0,2.0.0)");
    CHECK(rng.contains(v("1.0.0")));
    CHECK(rng.contains(v("1.9.9")));
    CHECK_FALSE(rng.contains(v("2.0.0")));
    CHECK_FALSE(rng.contains(v("0.9.0")));
    CHECK(rng.to_string() == ">=1.0.0 <2.0.0");

    rng = iv("(1.0.0, 2.0.0]");
    CHECK_FALSE(rng.contains(v("1.0.0")));
    CHECK(rng.contains(v("2.0.0")));
    CHECK(rng.to_string() == ">1.0.0 <=2.0.0");

    rng = iv("[1.2.0,)");
    CHECK(rng.contains(v("99.0.0")));
    CHECK(rng.to_string() == ">=1.2.0");

    rng = iv("(,3.0.0)");
    CHECK(rng.contains(v("0.0.1")));
    CHECK(rng.to_string() == "<3.0.0");
}

TEST_CASE("Bad interval strings") {
    CHECK_THROWS(iv("1.0.0"));
    CHECK_THROWS(iv("[1.0.0 2.0.0)"));
    CHECK_THROWS(iv("[2.0.0,1.0.0)"));
    CHECK_THROWS(iv("[1.0.0,1.0.0)"));
    CHECK_THROWS(iv("[1.0,2.0.0)"));
}

TEST_CASE("Set operations") {
    auto a = version_range_set::between(v("1.0.0"), v("2.0.0"));
    auto b = version_range_set::between(v("1.5.0"), v("3.0.0"));

    SECTION("Intersection") {
        auto i = a.intersection(b);
        CHECK(i == version_range_set::between(v("1.5.0"), v("2.0.0")));
        CHECK(a.intersects(b));
    }

    SECTION("Union merges overlapping and adjacent intervals") {
        auto u = a.union_(b);
        CHECK(u == version_range_set::between(v("1.0.0"), v("3.0.0")));
        CHECK(u.intervals().size() == 1);

        auto c = version_range_set::between(v("2.0.0"), v("2.5.0"));
        CHECK(a.union_(c) == version_range_set::between(v("1.0.0"), v("2.5.0")));
    }

    SECTION("Difference") {
        auto d = a.difference(b);
        CHECK(d == version_range_set::between(v("1.0.0"), v("1.5.0")));
        auto hole = a.difference(version_range_set::exactly(v("1.2.0")));
        CHECK(hole.intervals().size() == 2);
        CHECK_FALSE(hole.contains(v("1.2.0")));
        CHECK(hole.contains(v("1.2.1")));
        CHECK(hole.contains(v("1.1.9")));
        CHECK(hole.to_string() == ">=1.0.0 <1.2.0 || >1.2.0 <2.0.0");
    }

    SECTION("Complement") {
        auto c = a.complement();
        CHECK_FALSE(c.contains(v("1.0.0")));
        CHECK(c.contains(v("2.0.0")));
        CHECK(c.contains(v("0.1.0")));
        CHECK(c.complement() == a);
        CHECK(version_range_set::any().complement().empty());
        CHECK(version_range_set::none().complement().is_any());
    }

    SECTION("Containment and disjointness") {
        CHECK(a.contains(version_range_set::between(v("1.2.0"), v("1.3.0"))));
        CHECK_FALSE(a.contains(b));
        CHECK(version_range_set::any().contains(a));
        CHECK(a.contains(version_range_set::none()));
        auto far = version_range_set::between(v("2.0.0"), v("3.0.0"));
        CHECK(a.disjoint(far));
    }
}

TEST_CASE("Single versions") {
    auto one = version_range_set::exactly(v("1.2.3"));
    CHECK(one.sole_version() == v("1.2.3"));
    CHECK(one.to_string() == "1.2.3");
    CHECK_FALSE(version_range_set::at_least(v("1.2.3")).sole_version().has_value());
}

TEST_CASE("Convenience ranges") {
    CHECK(version_range_set::up_to_next_major(v("1.2.3")).to_string() == ">=1.2.3 <2.0.0");
    CHECK(version_range_set::up_to_next_minor(v("1.2.3")).to_string() == ">=1.2.3 <1.3.0");
    CHECK(version_range_set::any().to_string() == "*");
    CHECK(version_range_set::none().to_string() == "(none)");
}
