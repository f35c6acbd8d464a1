#pragma once
#include "service/service.hpp"

#include <atomic>
#include <thread>

namespace wakescribe {

// Maps process signals onto the service control surface:
//   SIGINT/SIGTERM -> stop, SIGUSR1 -> pause/resume, SIGHUP -> reload,
//   SIGUSR2 -> log status.
// Handlers only set flags; a watcher thread forwards them.
class SignalControl {
public:
    explicit SignalControl(Service& service);
    ~SignalControl();
    SignalControl(const SignalControl&) = delete;
    SignalControl& operator=(const SignalControl&) = delete;

    void start();
    void stop();

private:
    void run();

    Service& service_;
    std::thread thread_;
    std::atomic<bool> running_{false};
};

} // namespace wakescribe
