#pragma once
#include "asr/recognizer.hpp"
#include "audio/framer.hpp"
#include "audio/vad.hpp"
#include "session/notification.hpp"
#include "transcript/transcript_writer.hpp"
#include "wake/wake_word_detector.hpp"
#include "wake/wake_word_spec.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace wakescribe {

// One command-capture episode, from detection to finalization.
struct Session {
    std::uint64_t id{0};
    DetectionEvent trigger;
    SteadyClock::time_point startedAt{};
    SteadyClock::time_point lastSpeechAt{}; // silence timer origin
    std::string partial;                    // latest non-empty hypothesis
};

// Idle -> Listening on a wake word, Listening -> Finalizing on silence or hard
// timeout, Finalizing -> Idle once the final text is handed to the writer.
// Driven synchronously by the audio loop; timers use frame capture times.
class SessionStateMachine {
public:
    enum class State { Idle, Listening, Finalizing };

    struct Config {
        int silenceTimeoutMs = 2000;
        int hardTimeoutMs = 30000;
        int scoreIntervalMs = 250;
        int sampleRate = 16000;
        WakeWordDetector::Config detector;
        EnergyVAD::Config vad;
    };

    SessionStateMachine(const Config& config,
                        WakeWordSpec spec,
                        Recognizer& recognizer,
                        TranscriptWriter& writer,
                        NotificationSink& hooks);

    // `frame` must already be pushed into `framer`. Recognizer faults are
    // handled here and never propagate.
    void processFrame(const AudioFrame& frame, const Framer& framer);

    // Starts a session unless paused, already active, or below threshold.
    bool handleDetection(const DetectionEvent& event, const AudioFrame& frame);

    // Pausing finalizes an in-flight session first.
    void setPaused(bool paused);

    // Finalize the in-flight session, if any.
    void flush(FinalizeReason reason);

    State state() const { return state_; }
    bool paused() const { return paused_; }
    bool sessionActive() const { return session_.has_value(); }
    const std::optional<Session>& session() const { return session_; }
    std::uint64_t sessionsStarted() const { return sessionsStarted_; }
    const WakeWordSpec& spec() const { return spec_; }

private:
    void scoreWindow(const AudioFrame& frame, const Framer& framer);
    void listen(const AudioFrame& frame);
    void finalize(FinalizeReason reason);
    void abandon(const std::string& what);
    void endSession(SessionSummary summary);
    void resetRecognizer();

    Config config_;
    WakeWordSpec spec_;
    Recognizer& recognizer_;
    TranscriptWriter& writer_;
    NotificationSink& hooks_;
    WakeWordDetector detector_;
    EnergyVAD vad_;

    State state_{State::Idle};
    bool paused_{false};
    std::optional<Session> session_;
    std::uint64_t sessionsStarted_{0};
    std::optional<SteadyClock::time_point> lastScoreAt_;
    std::uint64_t windowEnd_{0};
};

const char* toString(SessionStateMachine::State state);

} // namespace wakescribe
