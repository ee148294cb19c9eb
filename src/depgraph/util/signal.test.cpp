#include "./signal.hpp"

#include <catch2/catch.hpp>

#include <csignal>

TEST_CASE("Cancellation through a stop token") {
    std::stop_source stop;
    CHECK_NOTHROW(depgraph::cancellation_point(stop.get_token()));
    stop.request_stop();
    CHECK(depgraph::is_cancelled(stop.get_token()));
    CHECK_FALSE(depgraph::is_cancelled());
    CHECK_THROWS_AS(depgraph::cancellation_point(stop.get_token()), depgraph::user_cancelled);
}

TEST_CASE("Cancellation through a signal") {
    depgraph::install_signal_handlers();
    std::raise(SIGINT);
    CHECK(depgraph::is_cancelled());
    CHECK_THROWS_AS(depgraph::cancellation_point(), depgraph::user_cancelled);
    depgraph::reset_cancelled();
    CHECK_NOTHROW(depgraph::cancellation_point());

    depgraph::notify_cancel();
    CHECK(depgraph::is_cancelled(std::stop_token{}));
    depgraph::reset_cancelled();
}
