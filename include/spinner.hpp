#pragma once

#include <atomic>
#include <chrono>
#include <iosfwd>
#include <string>
#include <string_view>
#include <thread>

// Progress line with elapsed seconds, redrawn in place on `out`. Inactive
// unless `enabled`, so redirected output stays clean.
class Spinner {
public:
    Spinner(std::ostream& out, std::string_view label, bool enabled);
    ~Spinner();

    Spinner(const Spinner&) = delete;
    Spinner& operator=(const Spinner&) = delete;

    void stop();

    // True when stderr is a terminal.
    static bool stderr_is_terminal();

private:
    std::ostream& out_;
    std::string label_;
    std::atomic<bool> running_;
    std::thread thread_;
};
