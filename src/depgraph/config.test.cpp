#include "./config.hpp"

#include <depgraph/util/env.hpp>

#include <catch2/catch.hpp>

#include <stdlib.h>

namespace {

struct env_var {
    std::string name;

    env_var(std::string n, const char* value)
        : name(std::move(n)) {
        ::setenv(name.c_str(), value, 1);
    }

    ~env_var() { ::unsetenv(name.c_str()); }
};

}  // namespace

using namespace depgraph;

TEST_CASE("Configuration is read from the environment") {
    SECTION("Jobs") {
        env_var jobs{"DEPGRAPH_JOBS", "6"};
        CHECK(config::jobs() == 6);
        env_var bad{"DEPGRAPH_JOBS", "six"};
        CHECK(config::jobs() == 0);
    }
    SECTION("Prefetch") {
        CHECK(config::enable_prefetch());
        env_var no_prefetch{"DEPGRAPH_NO_PREFETCH", "1"};
        CHECK_FALSE(config::enable_prefetch());
    }
    SECTION("Log level") {
        env_var level{"DEPGRAPH_LOG_LEVEL", "trace"};
        CHECK(config::log_level() == log::level::trace);
        env_var bad{"DEPGRAPH_LOG_LEVEL", "loud"};
        CHECK(config::log_level() == log::level::info);
    }
    SECTION("Lockfile name") {
        CHECK(config::lockfile_name() == "depgraph.lock.json");
        env_var name{"DEPGRAPH_LOCKFILE_NAME", "deps.lock"};
        CHECK(config::lockfile_name() == "deps.lock");
    }
}

TEST_CASE("Truthy environment strings") {
    CHECK(is_truthy_string("1"));
    CHECK(is_truthy_string("Yes"));
    CHECK(is_truthy_string("ON"));
    CHECK_FALSE(is_truthy_string("0"));
    CHECK_FALSE(is_truthy_string("off"));
    CHECK_FALSE(is_truthy_string(""));

    env_var zero{"DEPGRAPH_TEST_INT", "0"};
    CHECK_FALSE(env_positive_int("DEPGRAPH_TEST_INT").has_value());
    env_var seven{"DEPGRAPH_TEST_INT", "7"};
    CHECK(env_positive_int("DEPGRAPH_TEST_INT") == 7);
    env_var trailing{"DEPGRAPH_TEST_INT", "7x"};
    CHECK_FALSE(env_positive_int("DEPGRAPH_TEST_INT").has_value());
}
