#define CATCH_CONFIG_RUNNER 1
#include <catch2/catch.hpp>

#include <depgraph/config.hpp>

int main(int argc, char** argv) {
    depgraph::config::init_from_environment();
    return Catch::Session().run(argc, argv);
}
