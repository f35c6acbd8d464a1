#include "service/service.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <chrono>

namespace wakescribe {

Service::Service(const Config& config,
                 AudioSource& source,
                 Framer& framer,
                 SessionStateMachine& machine,
                 TranscriptWriter& writer,
                 NotificationSink& hooks)
    : config_(config),
      source_(source),
      framer_(framer),
      machine_(machine),
      writer_(writer),
      hooks_(hooks) {}

void Service::setState(ServiceState state) {
    // Once stopping, the only way out is Stopped.
    ServiceState current = state_.load();
    do {
        if (current == state) return;
        if (current == ServiceState::Stopping && state != ServiceState::Stopped) return;
    } while (!state_.compare_exchange_weak(current, state));
    hooks_.onServiceStateChanged(state);
}

void Service::start() {
    if (stopRequested_.load()) return;
    setState(ServiceState::Starting);
    try {
        source_.open(config_.deviceSelector);
    } catch (const DeviceUnavailable&) {
        setState(ServiceState::Stopped);
        throw;
    }
    setState(ServiceState::Running);
    Log::info("Service", "Listening for: " + [this] {
        std::string list;
        for (const auto& k : machine_.spec().keywords()) list += (list.empty() ? "" : ", ") + k;
        return list;
    }());
}

void Service::requestStop() {
    if (stopRequested_.exchange(true)) return;
    // Hooks for the transition are emitted by the loop; only the flag moves here.
    ServiceState s = state_.load();
    while ((s == ServiceState::Running || s == ServiceState::Paused || s == ServiceState::Starting) &&
           !state_.compare_exchange_weak(s, ServiceState::Stopping)) {
    }
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
    }
    stopCv_.notify_all();
}

ServiceStatus Service::status() const {
    ServiceStatus st;
    st.state = state_.load();
    st.sessionActive = sessionActive_.load();
    st.streamDegraded = degraded_.load();
    return st;
}

int Service::run() {
    int exitCode = kExitOk;
    if (!source_.isOpen() && !stopRequested_.load()) {
        Log::error("Service", "run() called before start()");
        return kExitDeviceUnavailable;
    }

    while (!stopRequested_.load()) {
        applyControl();

        AudioFrame frame;
        try {
            frame = source_.readFrame();
            consecutiveErrors_ = 0;
        } catch (const StreamError& e) {
            if (!recoverStream(e.what())) {
                if (!stopRequested_.load()) exitCode = kExitStreamLost;
                break;
            }
            continue;
        }

        // Stop observed: the frame in hand is not processed.
        if (stopRequested_.load()) break;

        try {
            framer_.push(frame);
            machine_.processFrame(frame, framer_);
        } catch (const std::exception& e) {
            Log::error("Service", std::string("Frame processing failed: ") + e.what());
        }
        ++framesProcessed_;
        sessionActive_.store(machine_.sessionActive());
    }

    shutdown();
    return exitCode;
}

void Service::applyControl() {
    auto cmd = control_.take();
    if (!cmd) return;

    const bool paused = state_.load() == ServiceState::Paused;
    switch (*cmd) {
        case ControlCommand::TogglePause:
            cmd = paused ? ControlCommand::Resume : ControlCommand::Pause;
            break;
        default:
            break;
    }

    switch (*cmd) {
        case ControlCommand::Pause:
            if (state_.load() == ServiceState::Running) {
                machine_.setPaused(true);
                sessionActive_.store(false);
                setState(ServiceState::Paused);
            }
            break;
        case ControlCommand::Resume:
            if (state_.load() == ServiceState::Paused) {
                machine_.setPaused(false);
                setState(ServiceState::Running);
            }
            break;
        case ControlCommand::Reload:
            writer_.reopen();
            Log::info("Service", "Reloaded: transcript handle reopened");
            logStatusLine();
            break;
        case ControlCommand::LogStatus:
            logStatusLine();
            break;
        case ControlCommand::None:
        case ControlCommand::TogglePause:
            break;
    }
}

void Service::logStatusLine() const {
    ServiceStatus st = status();
    Log::info("Service", std::string("Status: ") + toString(st.state) +
                         ", session " + (st.sessionActive ? "active" : "idle") +
                         ", stream " + (st.streamDegraded ? "degraded" : "ok") +
                         ", frames " + std::to_string(framesProcessed_.load()));
}

bool Service::waitForStop(int ms) {
    std::unique_lock<std::mutex> lock(stopMutex_);
    return stopCv_.wait_for(lock, std::chrono::milliseconds(ms),
                            [this] { return stopRequested_.load(); });
}

bool Service::recoverStream(const std::string& what) {
    ++consecutiveErrors_;
    if (consecutiveErrors_ <= config_.maxStreamErrors) {
        Log::warn("Service", "Stream error (" + std::to_string(consecutiveErrors_) + "/" +
                             std::to_string(config_.maxStreamErrors) + "), frame dropped: " + what);
        return true;
    }

    degraded_.store(true);
    hooks_.onStreamFault(what, true);
    Log::error("Service", "Audio stream lost, reopening: " + what);

    // Never drop in-progress speech, even when the device goes away.
    machine_.flush(FinalizeReason::StreamLost);
    sessionActive_.store(false);
    source_.close();

    int delay = config_.initialBackoffMs;
    for (int attempt = 1; config_.maxReopenAttempts == 0 || attempt <= config_.maxReopenAttempts; ++attempt) {
        if (waitForStop(delay)) return false;
        try {
            source_.open(config_.deviceSelector);
            degraded_.store(false);
            consecutiveErrors_ = 0;
            Log::info("Service", "Audio stream reopened after " + std::to_string(attempt) + " attempt(s)");
            return true;
        } catch (const std::runtime_error& e) {
            Log::warn("Service", "Reopen attempt " + std::to_string(attempt) + " failed: " + e.what());
        }
        delay = std::min(delay * 2, config_.maxBackoffMs);
    }

    Log::error("Service", "Giving up on the audio device after " +
                          std::to_string(config_.maxReopenAttempts) + " attempts");
    return false;
}

void Service::shutdown() {
    // requestStop() may already have moved the flag; announce it once from here.
    state_.store(ServiceState::Stopping);
    hooks_.onServiceStateChanged(ServiceState::Stopping);
    machine_.flush(FinalizeReason::Stop);
    sessionActive_.store(false);
    source_.close();
    setState(ServiceState::Stopped);
}

} // namespace wakescribe
