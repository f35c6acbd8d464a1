#include "session/notification.hpp"
#include "core/log.hpp"

namespace wakescribe {

const char* toString(FinalizeReason reason) {
    switch (reason) {
        case FinalizeReason::Silence:         return "silence";
        case FinalizeReason::HardTimeout:     return "hard-timeout";
        case FinalizeReason::Stop:            return "stop";
        case FinalizeReason::Pause:           return "pause";
        case FinalizeReason::StreamLost:      return "stream-lost";
        case FinalizeReason::RecognizerFault: return "recognizer-fault";
    }
    return "unknown";
}

const char* toString(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Transcribed: return "transcribed";
        case SessionOutcome::Empty:       return "empty";
        case SessionOutcome::Abandoned:   return "abandoned";
        case SessionOutcome::WriteFailed: return "write-failed";
    }
    return "unknown";
}

void LoggingSink::onWakeWordDetected(const DetectionEvent& event) {
    Log::info("Hooks", "Wake word detected: " + event.keyword);
}

void LoggingSink::onSessionStart(const SessionInfo& info) {
    Log::info("Hooks", "Session " + std::to_string(info.id) + " listening");
}

void LoggingSink::onSessionEnd(const SessionSummary& summary) {
    std::string line = "Session " + std::to_string(summary.info.id) + " ended (" +
                       toString(summary.reason) + ", " + toString(summary.outcome) + ")";
    if (!summary.text.empty()) line += ": " + summary.text;
    Log::info("Hooks", line);
}

void LoggingSink::onServiceStateChanged(ServiceState state) {
    Log::info("Hooks", std::string("Service ") + toString(state));
}

void LoggingSink::onStreamFault(const std::string& what, bool persistent) {
    if (persistent) Log::error("Hooks", "Audio stream degraded: " + what);
    else            Log::warn("Hooks", "Audio stream fault: " + what);
}

} // namespace wakescribe
