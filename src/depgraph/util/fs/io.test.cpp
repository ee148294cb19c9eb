#include "./io.hpp"

#include <depgraph/depgraph.test.hpp>
#include <depgraph/error/try_catch.hpp>
#include <depgraph/testing/temp_dir.hpp>

#include <catch2/catch.hpp>

#include <cerrno>
#include <iterator>

using namespace depgraph;

TEST_CASE("Replace a file atomically") {
    auto tdir = testing::temporary_dir::create();
    auto path = tdir.path() / "data.json";

    REQUIRES_LEAF_NOFAIL(write_file_atomic(path, "first"));
    CHECK(read_file(path) == "first");
    REQUIRES_LEAF_NOFAIL(write_file_atomic(path, "second"));
    CHECK(read_file(path) == "second");

    auto entries = std::filesystem::directory_iterator{tdir.path()};
    CHECK(std::distance(begin(entries), end(entries)) == 1);
}

TEST_CASE("Sync files and directories to disk") {
    auto tdir = testing::temporary_dir::create();
    auto path = tdir.path() / "data.json";
    REQUIRES_LEAF_NOFAIL(write_file(path, "content"));
    REQUIRES_LEAF_NOFAIL(sync_to_disk(path));
    REQUIRES_LEAF_NOFAIL(sync_to_disk(tdir.path()));

    auto missing = tdir.path() / "missing.json";
    depgraph_leaf_try {
        sync_to_disk(missing);
        FAIL_CHECK("Expected syncing a missing file to fail");
    }
    depgraph_leaf_catch(const std::system_error& e, e_write_file_path where) {
        CHECK(e.code().value() == ENOENT);
        CHECK(where.value == missing);
    }
    depgraph_leaf_catch_all { FAIL_CHECK("Unexpected error: " << diagnostic_info); };
}
