#pragma once

#include <stdexcept>
#include <stop_token>

namespace depgraph {

/**
 * @brief Thrown from a cancellation point once cancellation has been requested
 */
class user_cancelled : public std::exception {
public:
    const char* what() const noexcept override { return "The operation was cancelled"; }
};

/// Route SIGINT and SIGTERM (and SIGQUIT where available) to a process-wide cancellation flag
void install_signal_handlers() noexcept;

/// Set the process-wide cancellation flag as if an interrupt was received
void notify_cancel() noexcept;
void reset_cancelled() noexcept;

/// Whether the process-wide cancellation flag is set
bool is_cancelled() noexcept;

/**
 * @brief Check whether the process received an interrupt signal or the given stop token has
 * been triggered.
 */
bool is_cancelled(const std::stop_token& tok) noexcept;

/**
 * @brief Throw user_cancelled if cancellation has been requested, either globally or through
 * the given token.
 */
void cancellation_point(const std::stop_token& tok = {});

}  // namespace depgraph
