#include "./parallel.hpp"

#include <depgraph/util/log.hpp>
#include <depgraph/util/signal.hpp>

using namespace depgraph;

void depgraph::log_secondary_failure(std::exception_ptr eptr) noexcept {
    try {
        std::rethrow_exception(eptr);
    } catch (const user_cancelled&) {
        depgraph_log(debug, "Another parallel task was cancelled");
    } catch (const std::exception& e) {
        depgraph_log(error, "Another parallel task also failed: {}", e.what());
    } catch (...) {
        depgraph_log(error, "Another parallel task also failed with an unknown exception");
    }
}
