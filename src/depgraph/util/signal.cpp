#include "./signal.hpp"

#include <array>
#include <csignal>

using namespace depgraph;

namespace {

/// The last cancelling signal received, or zero
volatile std::sig_atomic_t pending_signal = 0;

extern "C" void on_cancel_signal(int sig) { pending_signal = sig; }

constexpr std::array cancel_signals = {
    SIGINT,
    SIGTERM,
#ifdef SIGQUIT
    SIGQUIT,
#endif
};

}  // namespace

void depgraph::install_signal_handlers() noexcept {
    for (auto sig : cancel_signals) {
        std::signal(sig, on_cancel_signal);
    }
}

void depgraph::notify_cancel() noexcept { pending_signal = SIGINT; }

void depgraph::reset_cancelled() noexcept { pending_signal = 0; }

bool depgraph::is_cancelled() noexcept { return pending_signal != 0; }

bool depgraph::is_cancelled(const std::stop_token& tok) noexcept {
    return tok.stop_requested() || is_cancelled();
}

void depgraph::cancellation_point(const std::stop_token& tok) {
    if (is_cancelled(tok)) {
        throw user_cancelled();
    }
}
