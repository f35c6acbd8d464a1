#pragma once
#include "audio/audio_source.hpp"
#include "audio/framer.hpp"
#include "service/control_channel.hpp"
#include "service/service_state.hpp"
#include "session/notification.hpp"
#include "session/session_state_machine.hpp"
#include "transcript/transcript_writer.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace wakescribe {

// Process exit codes the service manager can act on.
constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitDeviceUnavailable = 2;
constexpr int kExitStreamLost = 3;
constexpr int kExitModelUnavailable = 4;

// Owns the frame loop: source -> framer -> state machine, plus lifecycle,
// control commands and stream recovery. run() is the only place frames are
// read; every other method is safe to call from any thread.
class Service {
public:
    struct Config {
        std::optional<std::string> deviceSelector;
        int maxStreamErrors = 5;     // consecutive, before reopening
        int maxReopenAttempts = 10;  // 0 = retry forever
        int initialBackoffMs = 250;
        int maxBackoffMs = 8000;
    };

    Service(const Config& config,
            AudioSource& source,
            Framer& framer,
            SessionStateMachine& machine,
            TranscriptWriter& writer,
            NotificationSink& hooks);

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;

    // Opens the audio source. Throws DeviceUnavailable.
    void start();

    // Frame loop on the calling thread until stopped. Returns an exit code.
    int run();

    // Idempotent.
    void requestStop();

    bool pause() { return control_.post(ControlCommand::Pause); }
    bool resume() { return control_.post(ControlCommand::Resume); }
    bool togglePause() { return control_.post(ControlCommand::TogglePause); }
    bool reload() { return control_.post(ControlCommand::Reload); }
    bool logStatus() { return control_.post(ControlCommand::LogStatus); }

    ServiceStatus status() const;
    bool stopRequested() const { return stopRequested_.load(); }
    std::uint64_t framesProcessed() const { return framesProcessed_.load(); }

private:
    void applyControl();
    bool recoverStream(const std::string& what);
    bool waitForStop(int ms);
    void shutdown();
    void setState(ServiceState state);
    void logStatusLine() const;

    Config config_;
    AudioSource& source_;
    Framer& framer_;
    SessionStateMachine& machine_;
    TranscriptWriter& writer_;
    NotificationSink& hooks_;

    ControlChannel control_;
    std::atomic<ServiceState> state_{ServiceState::Stopped};
    std::atomic<bool> stopRequested_{false};
    std::atomic<bool> sessionActive_{false};
    std::atomic<bool> degraded_{false};
    std::atomic<std::uint64_t> framesProcessed_{0};
    int consecutiveErrors_{0};

    std::mutex stopMutex_;
    std::condition_variable stopCv_;
};

} // namespace wakescribe
