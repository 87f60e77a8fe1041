#ifndef MCPTOOLS_SHUTDOWN_SIGNAL_HPP
#define MCPTOOLS_SHUTDOWN_SIGNAL_HPP

// SIGINT/SIGTERM handling for the server loop.

#include <csignal>

namespace shutdown_signal {

// Install handlers for SIGINT and SIGTERM. A blocked read on stdin is
// interrupted (no SA_RESTART) so the server loop can observe the request.
void install();

// Nonzero once a termination signal was received.
const volatile std::sig_atomic_t *requested_flag();

} // namespace shutdown_signal

#endif // MCPTOOLS_SHUTDOWN_SIGNAL_HPP
