#include "./parallel.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <latch>
#include <stdexcept>

TEST_CASE("Run a simple parallel task") {
    std::vector<int> numbers = {1, 2, 3, 4, 5, 6, 7, 8, 9, 10};
    std::atomic<int> sum     = 0;
    depgraph::parallel_run(numbers, 3, [&](int n) { sum += n; });
    CHECK(sum == 55);
}

TEST_CASE("The first exception is rethrown") {
    std::vector<int> numbers = {1, 2, 3};
    CHECK_THROWS_AS(depgraph::parallel_run(numbers,
                                           1,
                                           [&](int n) {
                                               if (n == 2) {
                                                   throw std::runtime_error("two");
                                               }
                                           }),
                    std::runtime_error);
}

TEST_CASE("Later failures of any type are logged, not propagated") {
    std::vector<int> numbers = {1, 2};
    std::latch       both_started{2};
    CHECK_THROWS(depgraph::parallel_run(numbers, 2, [&](int n) {
        both_started.arrive_and_wait();
        if (n == 1) {
            throw std::runtime_error("one");
        }
        throw n;
    }));
}
