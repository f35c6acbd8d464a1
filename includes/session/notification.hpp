#pragma once
#include "service/service_state.hpp"
#include "wake/wake_word_detector.hpp"

#include <cstdint>
#include <string>

namespace wakescribe {

struct SessionInfo {
    std::uint64_t id{0};
    DetectionEvent trigger;
};

enum class FinalizeReason { Silence, HardTimeout, Stop, Pause, StreamLost, RecognizerFault };

enum class SessionOutcome {
    Transcribed, // entry written
    Empty,       // nothing but the wake word, or silence
    Abandoned,   // recognizer fault, nothing written
    WriteFailed  // text produced, entry dropped
};

struct SessionSummary {
    SessionInfo info;
    FinalizeReason reason{FinalizeReason::Silence};
    SessionOutcome outcome{SessionOutcome::Empty};
    std::string text;
    WallClock::time_point endedAt{};
};

const char* toString(FinalizeReason reason);
const char* toString(SessionOutcome outcome);

// Receives state machine and service events (LED driver, tray, journal, log).
// Implementations must not assume they run on the audio thread.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void onWakeWordDetected(const DetectionEvent&) {}
    virtual void onSessionStart(const SessionInfo&) {}
    virtual void onSessionEnd(const SessionSummary&) {}
    virtual void onServiceStateChanged(ServiceState) {}
    virtual void onStreamFault(const std::string& /*what*/, bool /*persistent*/) {}
};

// Writes every event to the log.
class LoggingSink : public NotificationSink {
public:
    void onWakeWordDetected(const DetectionEvent& event) override;
    void onSessionStart(const SessionInfo& info) override;
    void onSessionEnd(const SessionSummary& summary) override;
    void onServiceStateChanged(ServiceState state) override;
    void onStreamFault(const std::string& what, bool persistent) override;
};

} // namespace wakescribe
