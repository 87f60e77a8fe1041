#include "utils/shutdown_signal.hpp"

#include <signal.h>
#include <cstring>

namespace shutdown_signal {

static volatile std::sig_atomic_t shutdown_requested = 0;

static void signal_handler(int signal_number) {
    (void)signal_number;
    shutdown_requested = 1;
}

void install() {
    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = signal_handler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

const volatile std::sig_atomic_t *requested_flag() {
    return &shutdown_requested;
}

} // namespace shutdown_signal
