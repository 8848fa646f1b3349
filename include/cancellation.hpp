#pragma once

#include <atomic>

class CancellationToken {
public:
    void cancel() { cancelled_ = true; }
    bool cancelled() const { return cancelled_; }

    // Token set by SIGINT once install_interrupt_handler() has run.
    static CancellationToken& interrupt();

private:
    std::atomic<bool> cancelled_{false};
};

void install_interrupt_handler();
