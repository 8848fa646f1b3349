#include "spinner.hpp"
#include "colors.hpp"
#include <ostream>
#include <unistd.h>

namespace {

const char* const FRAMES[] = {"⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"};
const int FRAME_COUNT = sizeof(FRAMES) / sizeof(FRAMES[0]);

} // namespace

Spinner::Spinner(std::ostream& out, std::string_view label, bool enabled)
    : out_(out), label_(label), running_(enabled) {
    if (!running_) {
        return;
    }
    thread_ = std::thread([this]() {
        const auto started = std::chrono::steady_clock::now();
        size_t line_width = 0;
        for (int frame = 0; running_; frame = (frame + 1) % FRAME_COUNT) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started);
            std::string line = label_ + " (" + std::to_string(elapsed.count()) + "s)";
            line_width = line.size() + 2;
            out_ << "\r" << Colors::GREEN << FRAMES[frame] << Colors::RESET << " " << line << std::flush;
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        out_ << "\r" << std::string(line_width, ' ') << "\r" << std::flush;
    });
}

Spinner::~Spinner() {
    stop();
}

void Spinner::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool Spinner::stderr_is_terminal() {
    return isatty(STDERR_FILENO) == 1;
}
