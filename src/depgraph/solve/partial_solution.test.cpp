#include "./partial_solution.hpp"

#include <catch2/catch.hpp>

using namespace depgraph;

namespace {

package_identity id(std::string_view s) { return package_identity::from_string(s); }

term mk(std::string_view pkg, std::string_view interval, bool positive = true) {
    return term{id(pkg), version_range_set::parse_interval(interval), positive};
}

}  // namespace

TEST_CASE("Assignments accumulate and backtrack by level") {
    partial_solution sln;
    sln.derive(mk("foo", "[1.0.0,3.0.0)"), 0);
    CHECK(sln.decision_level() == 0);

    sln.decide(id("bar"), semver::version::parse("1.0.0"));
    CHECK(sln.decision_level() == 1);
    sln.derive(mk("foo", "[2.0.0,3.0.0)", false), 1);

    CHECK(sln.satisfies(mk("foo", "[1.0.0,2.0.0)")));
    CHECK(sln.relation(mk("foo", "[2.0.0,5.0.0)")) == set_relation::disjoint);
    CHECK(sln.relation(mk("foo", "[1.5.0,5.0.0)")) == set_relation::overlapping);
    CHECK(sln.relation(mk("baz", "[1.0.0,2.0.0)")) == set_relation::overlapping);

    CHECK(sln.satisfier(mk("foo", "[1.0.0,2.0.0)")).index == 2);
    CHECK(sln.satisfier(mk("foo", "[1.0.0,3.0.0)")).index == 0);
    CHECK(sln.satisfier(mk("bar", "[1.0.0,1.0.0]")).is_decision());

    auto undecided = sln.undecided();
    REQUIRE(undecided.size() == 1);
    CHECK(undecided.front() == mk("foo", "[1.0.0,2.0.0)"));

    sln.backtrack(0);
    CHECK(sln.assignments().size() == 1);
    CHECK(sln.decisions().empty());
    CHECK(sln.relation(mk("foo", "[1.0.0,2.0.0)")) == set_relation::overlapping);
    CHECK(sln.satisfies(mk("foo", "[0.1.0,3.0.0)")));
    undecided = sln.undecided();
    REQUIRE(undecided.size() == 1);
    CHECK(undecided.front() == mk("foo", "[1.0.0,3.0.0)"));
}

TEST_CASE("Incompatibilities merge terms of the same package") {
    incompatibility_store store{id("root")};

    auto plain = store.create({mk("a", "[1.0.0,1.0.0]"), mk("b", "[1.0.0,2.0.0)", false)},
                              cause::dependency{});
    CHECK(store[plain].terms.size() == 2);
    CHECK(store.for_package(id("a")).empty());

    store.attach(plain);
    CHECK(store.for_package(id("a")) == std::vector<incompatibility_id>{plain});
    CHECK(store.for_package(id("b")) == std::vector<incompatibility_id>{plain});

    auto merged = store.add(
        {
            mk("a", "[1.0.0,2.0.0)"),
            mk("b", "[1.0.0,2.0.0)", false),
            mk("a", "[1.5.0,3.0.0)"),
        },
        cause::derived{plain, plain});
    REQUIRE(store[merged].terms.size() == 2);
    CHECK(store[merged].terms.front() == mk("a", "[1.5.0,2.0.0)"));

    auto no_root = store.create({mk("root", "[0.0.0,0.0.0]"), mk("a", "[1.0.0,2.0.0)")},
                                cause::derived{plain, merged});
    REQUIRE(store[no_root].terms.size() == 1);
    CHECK(store[no_root].terms.front().package == id("a"));
    CHECK_FALSE(store[no_root].is_failure(id("root")));

    auto failure = store.create({}, cause::derived{no_root, plain});
    CHECK(store[failure].is_failure(id("root")));
    CHECK(store.size() == 4);
}
