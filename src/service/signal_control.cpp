#include "service/signal_control.hpp"
#include "core/log.hpp"

#include <chrono>
#include <csignal>

namespace wakescribe {

namespace {

std::atomic<bool> g_stop{false};
std::atomic<int> g_togglePause{0};
std::atomic<bool> g_reload{false};
std::atomic<bool> g_status{false};

void on_signal(int sig) {
    switch (sig) {
        case SIGINT:
        case SIGTERM: g_stop.store(true); break;
        case SIGUSR1: g_togglePause.fetch_add(1); break;
        case SIGHUP:  g_reload.store(true); break;
        case SIGUSR2: g_status.store(true); break;
        default: break;
    }
}

} // namespace

SignalControl::SignalControl(Service& service) : service_(service) {}

SignalControl::~SignalControl() {
    stop();
}

void SignalControl::start() {
    if (running_.exchange(true)) return;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGUSR1, on_signal);
    std::signal(SIGUSR2, on_signal);
    std::signal(SIGHUP, on_signal);
    thread_ = std::thread(&SignalControl::run, this);
}

void SignalControl::stop() {
    if (!running_.exchange(false)) return;
    if (thread_.joinable()) thread_.join();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGUSR1, SIG_DFL);
    std::signal(SIGUSR2, SIG_DFL);
    std::signal(SIGHUP, SIG_DFL);
}

void SignalControl::run() {
    while (running_.load()) {
        if (g_stop.exchange(false)) {
            Log::info("Signals", "Termination signal received, shutting down");
            service_.requestStop();
        }
        // The channel holds one command; anything that does not fit is retried.
        if (g_togglePause.load() > 0 && service_.togglePause()) g_togglePause.fetch_sub(1);
        if (g_reload.load() && service_.reload()) g_reload.store(false);
        if (g_status.load() && service_.logStatus()) g_status.store(false);

        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

} // namespace wakescribe
