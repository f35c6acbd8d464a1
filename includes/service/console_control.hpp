#pragma once

#include "core/log.hpp"
#include "service/service.hpp"

#include <atomic>
#include <chrono>
#include <fcntl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

namespace wakescribe {

// Foreground key controls: 'p' pause/resume, 's' status, 'q' quit.
// Only useful when stdin is a terminal.
class ConsoleControl {
public:
    explicit ConsoleControl(Service& service) : service_(service) {
        if (!isatty(STDIN_FILENO) || tcgetattr(STDIN_FILENO, &oldSettings_) < 0) {
            return;
        }
        newSettings_ = oldSettings_;
        newSettings_.c_lflag &= ~(ICANON | ECHO);  // keep ISIG so Ctrl+C still stops
        newSettings_.c_cc[VMIN] = 1;
        newSettings_.c_cc[VTIME] = 0;
        oldFlags_ = fcntl(STDIN_FILENO, F_GETFL, 0);
        usable_ = oldFlags_ >= 0;
    }

    ~ConsoleControl() {
        stop();
    }

    ConsoleControl(const ConsoleControl&) = delete;
    ConsoleControl& operator=(const ConsoleControl&) = delete;

    bool usable() const { return usable_; }

    void start() {
        if (!usable_ || running_) return;

        if (tcsetattr(STDIN_FILENO, TCSANOW, &newSettings_) < 0 ||
            fcntl(STDIN_FILENO, F_SETFL, oldFlags_ | O_NONBLOCK) < 0) {
            Log::warn("Console", "Cannot switch the terminal to key mode, console controls disabled");
            tcsetattr(STDIN_FILENO, TCSANOW, &oldSettings_);
            return;
        }

        running_ = true;
        Log::info("Console", "Keys: p = pause/resume, s = status, q = quit");
        thread_ = std::thread([this]() {
            const auto pollInterval = std::chrono::milliseconds(20);
            char c;
            while (running_) {
                if (read(STDIN_FILENO, &c, 1) > 0) {
                    switch (c) {
                        case 'p': case 'P':
                            if (!service_.togglePause()) Log::warn("Console", "Busy, press again");
                            break;
                        case 's': case 'S':
                            service_.logStatus();
                            break;
                        case 'q': case 'Q':
                            service_.requestStop();
                            break;
                        default:
                            break;
                    }
                }
                std::this_thread::sleep_for(pollInterval);
            }
        });
    }

    void stop() {
        if (!running_) return;
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        fcntl(STDIN_FILENO, F_SETFL, oldFlags_);
        tcsetattr(STDIN_FILENO, TCSANOW, &oldSettings_);
    }

private:
    Service& service_;
    std::atomic<bool> running_{false};
    bool usable_{false};
    std::thread thread_;
    int oldFlags_{-1};
    struct termios oldSettings_{};
    struct termios newSettings_{};
};

} // namespace wakescribe
