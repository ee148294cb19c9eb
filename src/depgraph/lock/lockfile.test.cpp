#include "./lockfile.hpp"

#include <depgraph/depgraph.test.hpp>
#include <depgraph/error/try_catch.hpp>
#include <depgraph/testing/temp_dir.hpp>
#include <depgraph/util/fs/io.hpp>

#include <catch2/catch.hpp>

#include <iterator>

using namespace depgraph;

namespace {

package_identity id(std::string_view s) { return package_identity::from_string(s); }

solution example_solution() {
    return {
        {id("b"), package_version{semver::version::parse("1.2.0")}},
        {id("a"), package_version{revision_pin{"abc123", "main"}}},
        {id("c"), package_version{revision_pin{"def456"}}},
        {id("local"), package_version{path_requirement{"/src/local"}}},
    };
}

const std::string_view example_json = R"({
  "pins": [
    {
      "identity": "a",
      "kind": "branch",
      "branch": "main",
      "revision": "abc123"
    },
    {
      "identity": "b",
      "kind": "version",
      "version": "1.2.0"
    },
    {
      "identity": "c",
      "kind": "revision",
      "revision": "def456"
    }
  ],
  "schema-version": 1
}
)";

std::string expect_invalid(std::string_view content) {
    std::optional<std::string> msg = depgraph_leaf_try->std::optional<std::string> {
        (void)lockfile::from_json_str(content);
        FAIL("Expected the lockfile to be rejected: " << content);
        return std::nullopt;
    }
    depgraph_leaf_catch(const e_invalid_lockfile& e)->std::optional<std::string> {
        return e.value;
    }
    depgraph_leaf_catch_all->std::optional<std::string> {
        FAIL("Unexpected error: " << diagnostic_info);
        return std::nullopt;
    };
    REQUIRE(msg.has_value());
    return *msg;
}

}  // namespace

TEST_CASE("Local path packages are not pinned") {
    auto lock = lockfile::from_solution(example_solution());
    CHECK(lock.pins().size() == 3);
    CHECK(lock.find(id("local")) == nullptr);
    REQUIRE(lock.find(id("a")));
    CHECK(*lock.find(id("a")) == package_version{revision_pin{"abc123", "main"}});
}

TEST_CASE("Render a lockfile") {
    auto lock = lockfile::from_solution(example_solution());
    CHECK(lock.to_json() == example_json);
    CHECK(lockfile{}.to_json() == "{\n  \"pins\": [],\n  \"schema-version\": 1\n}\n");
}

TEST_CASE("Parse a lockfile") {
    auto lock = REQUIRES_LEAF_NOFAIL(lockfile::from_json_str(example_json));
    CHECK(lock == lockfile::from_solution(example_solution()));

    // JSON5 is accepted
    lock = REQUIRES_LEAF_NOFAIL(lockfile::from_json_str(R"({
        // Written by hand
        pins: [{identity: 'B', kind: 'version', version: '1.2.0'},],
        'schema-version': 1,
    })"));
    REQUIRE(lock.find(id("b")));
    CHECK(*lock.find(id("b")) == package_version{semver::version::parse("1.2.0")});
}

TEST_CASE("Reject invalid lockfiles") {
    auto [given, expect_error] = GENERATE(Catch::Generators::table<std::string, std::string>({
        {"[]", "Root of a lockfile must be a JSON object"},
        {R"({"pins": []})", "A 'schema-version' integer is required"},
        {R"({"pins": [], "schema-version": 2})", "Only 'schema-version' == 1 is supported"},
        {R"({"schema-version": 1})", "A 'pins' array is required"},
        {R"({"schema-version": 1, "pins": {}})", "'pins' must be an array of pin objects"},
        {R"({"schema-version": 1, "pins": [12]})", "Each lockfile pin must be a JSON object"},
        {R"({"schema-version": 1, "pins": [{"kind": "version"}]})",
         "A pin must have an 'identity' string"},
        {R"({"schema-version": 1, "pins": [{"identity": "a", "kind": "version"}]})",
         "The 'version' pin of 'a' must have a 'version' string"},
        {R"({"schema-version": 1, "pins": [
            {"identity": "a", "kind": "branch", "branch": "main"}
         ]})",
         "The 'branch' pin of 'a' must have a 'revision' string"},
        {R"({"schema-version": 1, "pins": [
            {"identity": "a", "kind": "version", "version": "1.0.0", "branch": "main"}
         ]})",
         "The 'version' pin of 'a' may not have a 'branch' key"},
        {R"({"schema-version": 1, "pins": [
            {"identity": "a", "kind": "branch", "branch": "main", "revision": "abc123",
             "requested": "abc"}
         ]})",
         "The 'branch' pin of 'a' may not have a 'requested' key"},
        {R"({"schema-version": 1, "pins": [{"identity": "a", "kind": "path"}]})",
         "Package 'a' is pinned to a local path, which cannot be locked"},
        {R"({"schema-version": 1, "pins": [{"identity": "a", "kind": "tag"}]})",
         "Invalid pin kind 'tag'"},
        {R"({"schema-version": 1, "pins": [
            {"identity": "a", "kind": "version", "version": "bleh"}
         ]})",
         "Invalid semantic version string 'bleh'"},
        {R"({"schema-version": 1, "pins": [
            {"identity": "a", "kind": "version", "version": "1.0.0"},
            {"identity": "A", "kind": "version", "version": "1.1.0"}
         ]})",
         "Package 'a' is pinned more than once"},
        {R"({"schema-version": 1, "pins": [], "extra": true})", "Unknown lockfile key 'extra'"},
    }));
    INFO("Parsing data: " << given);
    CHECK(expect_invalid(given) == expect_error);
}

TEST_CASE("A resolved revision keeps the revision that was asked for") {
    lockfile lock = lockfile::from_solution({
        {id("x"), package_version{revision_pin{"abc123", std::nullopt, "abc"}}},
    });
    const std::string_view expect = R"({
  "pins": [
    {
      "identity": "x",
      "kind": "revision",
      "revision": "abc123",
      "requested": "abc"
    }
  ],
  "schema-version": 1
}
)";
    CHECK(lock.to_json() == expect);

    auto parsed = REQUIRES_LEAF_NOFAIL(lockfile::from_json_str(expect));
    CHECK(parsed == lock);
    REQUIRE(parsed.find(id("x")));
    CHECK(parsed.find(id("x"))->satisfies(requirement{revision_requirement{"abc"}}));
    CHECK_FALSE(parsed.find(id("x"))->satisfies(requirement{revision_requirement{"abc123"}}));
}

TEST_CASE("Unknown pin keys suggest a known key") {
    std::optional<e_bad_lockfile_key> bad = depgraph_leaf_try->std::optional<e_bad_lockfile_key> {
        (void)lockfile::from_json_str(R"({
            "schema-version": 1,
            "pins": [{"identity": "a", "kind": "revision", "revison": "abc"}]
        })");
        FAIL("Expected the lockfile to be rejected");
        return std::nullopt;
    }
    depgraph_leaf_catch(const e_bad_lockfile_key& e, e_invalid_lockfile)
        ->std::optional<e_bad_lockfile_key> {
        return e;
    }
    depgraph_leaf_catch_all->std::optional<e_bad_lockfile_key> {
        FAIL("Unexpected error: " << diagnostic_info);
        return std::nullopt;
    };
    REQUIRE(bad.has_value());
    CHECK(bad->given == "revison");
    CHECK(bad->nearest == "revision");
}

TEST_CASE("Malformed JSON is an invalid lockfile") {
    CHECK_FALSE(expect_invalid("{pins").empty());
}

TEST_CASE("Save and load a lockfile") {
    auto tdir = testing::temporary_dir::create();
    auto path = tdir.path() / "depgraph.lock.json";

    CHECK_FALSE(REQUIRES_LEAF_NOFAIL(lockfile::load_if_exists(path)).has_value());

    auto lock = lockfile::from_solution(example_solution());
    REQUIRES_LEAF_NOFAIL(lock.save(path));
    CHECK(read_file(path) == example_json);

    // Saving again replaces the file with identical content, leaving no temporary files behind
    REQUIRES_LEAF_NOFAIL(lockfile::from_solution(example_solution()).save(path));
    CHECK(read_file(path) == example_json);
    auto entries = std::filesystem::directory_iterator{tdir.path()};
    CHECK(std::distance(begin(entries), end(entries)) == 1);

    auto loaded = REQUIRES_LEAF_NOFAIL(lockfile::load_if_exists(path));
    REQUIRE(loaded.has_value());
    CHECK(*loaded == lock);
}

TEST_CASE("A failed save leaves nothing behind") {
    auto tdir = testing::temporary_dir::create();

    // A non-empty directory cannot be replaced by a file
    auto blocked = tdir.path() / "depgraph.lock.json";
    std::filesystem::create_directories(blocked / "child");

    depgraph_leaf_try {
        lockfile::from_solution(example_solution()).save(blocked);
        FAIL_CHECK("Expected the save to fail");
    }
    depgraph_leaf_catch(const std::filesystem::filesystem_error&) {}
    depgraph_leaf_catch_all { FAIL_CHECK("Unexpected error: " << diagnostic_info); };

    CHECK(std::filesystem::is_directory(blocked / "child"));
    auto entries = std::filesystem::directory_iterator{tdir.path()};
    CHECK(std::distance(begin(entries), end(entries)) == 1);
}
