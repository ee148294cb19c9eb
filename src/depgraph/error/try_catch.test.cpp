#include "./try_catch.hpp"

#include <depgraph/error/human.hpp>

#include <catch2/catch.hpp>

TEST_CASE("Try-catch") {
    auto r = depgraph_leaf_try { return 2; }
    depgraph_leaf_catch_all->int { return 0; };
    CHECK(r == 2);
}

TEST_CASE("Handlers receive loaded error objects") {
    auto r = depgraph_leaf_try->int {
        BOOST_LEAF_THROW_EXCEPTION(depgraph::e_human_message{"oops"});
    }
    depgraph_leaf_catch(depgraph::e_human_message msg) {
        CHECK(msg.value == "oops");
        return 7;
    }
    depgraph_leaf_catch_all->int { return 0; };
    CHECK(r == 7);
}
