#include "cancellation.hpp"
#include <csignal>

namespace {

void handle_interrupt(int) {
    CancellationToken::interrupt().cancel();
}

} // namespace

CancellationToken& CancellationToken::interrupt() {
    static CancellationToken token;
    return token;
}

void install_interrupt_handler() {
    static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");
    CancellationToken::interrupt();
    std::signal(SIGINT, handle_interrupt);
}
