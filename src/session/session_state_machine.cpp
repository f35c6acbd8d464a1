#include "session/session_state_machine.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"
#include "wake/phrase_match.hpp"

namespace wakescribe {

using std::chrono::milliseconds;

const char* toString(SessionStateMachine::State state) {
    switch (state) {
        case SessionStateMachine::State::Idle:       return "idle";
        case SessionStateMachine::State::Listening:  return "listening";
        case SessionStateMachine::State::Finalizing: return "finalizing";
    }
    return "unknown";
}

SessionStateMachine::SessionStateMachine(const Config& config,
                                         WakeWordSpec spec,
                                         Recognizer& recognizer,
                                         TranscriptWriter& writer,
                                         NotificationSink& hooks)
    : config_(config),
      spec_(std::move(spec)),
      recognizer_(recognizer),
      writer_(writer),
      hooks_(hooks),
      detector_(recognizer, config.detector),
      vad_(config.sampleRate, config.vad) {}

void SessionStateMachine::processFrame(const AudioFrame& frame, const Framer& framer) {
    windowEnd_ = framer.end();
    if (paused_) return;

    switch (state_) {
        case State::Idle:
            scoreWindow(frame, framer);
            break;
        case State::Listening:
            listen(frame);
            break;
        case State::Finalizing:
            // finalize() completes within the call that entered it.
            break;
    }
}

void SessionStateMachine::scoreWindow(const AudioFrame& frame, const Framer& framer) {
    // Reduced duty cycle: the recognizer only sees idle audio once per interval.
    if (lastScoreAt_ && frame.capturedAt - *lastScoreAt_ < milliseconds(config_.scoreIntervalMs)) {
        return;
    }
    lastScoreAt_ = frame.capturedAt;

    std::optional<DetectionEvent> event;
    try {
        event = detector_.score(framer.sliceSince(detector_.cursor()), spec_);
    } catch (const RecognizerFault& e) {
        Log::error("Session", std::string("Wake-word scoring failed: ") + e.what());
        resetRecognizer();
        detector_.resync(windowEnd_);
        return;
    }
    if (event) handleDetection(*event, frame);
}

bool SessionStateMachine::handleDetection(const DetectionEvent& event, const AudioFrame& frame) {
    if (paused_) {
        Log::debug("Session", "Ignoring '" + event.keyword + "' while paused");
        return false;
    }
    if (state_ != State::Idle) {
        Log::debug("Session", "Ignoring '" + event.keyword + "', session already active");
        return false;
    }
    if (event.confidence < detector_.threshold()) {
        Log::debug("Session", "Ignoring '" + event.keyword + "' below threshold");
        return false;
    }

    Session s;
    s.id = ++sessionsStarted_;
    s.trigger = event;
    s.startedAt = frame.capturedAt;
    s.lastSpeechAt = frame.capturedAt;
    s.partial = detector_.lastHypothesis();
    session_ = std::move(s);
    state_ = State::Listening;
    vad_.reset();

    // The recognizer keeps its context so words spoken right after the
    // keyword belong to this session.
    hooks_.onWakeWordDetected(event);
    hooks_.onSessionStart(SessionInfo{session_->id, event});
    return true;
}

void SessionStateMachine::listen(const AudioFrame& frame) {
    try {
        recognizer_.acceptFrame(frame.samples.data(), frame.samples.size());
        std::string partial = recognizer_.partialResult();

        bool speech = vad_.process(frame.samples.data(), frame.samples.size());
        if (partial != session_->partial && !partial.empty()) {
            session_->partial = std::move(partial);
            speech = true;
        }
        if (speech) session_->lastSpeechAt = frame.capturedAt;
    } catch (const RecognizerFault& e) {
        abandon(e.what());
        return;
    }

    if (frame.capturedAt - session_->startedAt >= milliseconds(config_.hardTimeoutMs)) {
        Log::info("Session", "Hard timeout after " + std::to_string(config_.hardTimeoutMs) + " ms");
        finalize(FinalizeReason::HardTimeout);
    } else if (frame.capturedAt - session_->lastSpeechAt >= milliseconds(config_.silenceTimeoutMs)) {
        finalize(FinalizeReason::Silence);
    }
}

void SessionStateMachine::finalize(FinalizeReason reason) {
    if (!session_) return;
    state_ = State::Finalizing;

    SessionSummary summary;
    summary.info = SessionInfo{session_->id, session_->trigger};
    summary.reason = reason;

    std::string text;
    try {
        text = recognizer_.finalResult();
    } catch (const RecognizerFault& e) {
        Log::error("Session", std::string("Final result failed: ") + e.what());
        summary.outcome = SessionOutcome::Abandoned;
        endSession(std::move(summary));
        return;
    }
    if (normalize_text(text).empty()) text = session_->partial;

    std::string command = detector_.stripKeyword(text, session_->trigger.keyword);
    if (command.empty()) {
        summary.outcome = SessionOutcome::Empty;
    } else {
        summary.text = command;
        const bool written = writer_.append(TranscriptEntry{session_->trigger.timestamp, command});
        summary.outcome = written ? SessionOutcome::Transcribed : SessionOutcome::WriteFailed;
    }
    endSession(std::move(summary));
}

void SessionStateMachine::abandon(const std::string& what) {
    Log::error("Session", "Recognizer fault, session " + std::to_string(session_->id) +
                          " abandoned: " + what);
    SessionSummary summary;
    summary.info = SessionInfo{session_->id, session_->trigger};
    summary.reason = FinalizeReason::RecognizerFault;
    summary.outcome = SessionOutcome::Abandoned;
    endSession(std::move(summary));
}

void SessionStateMachine::endSession(SessionSummary summary) {
    summary.endedAt = WallClock::now();
    resetRecognizer();
    detector_.resync(windowEnd_);
    session_.reset();
    state_ = State::Idle;
    lastScoreAt_.reset();
    hooks_.onSessionEnd(summary);
}

void SessionStateMachine::setPaused(bool paused) {
    if (paused == paused_) return;
    if (paused) {
        flush(FinalizeReason::Pause);
        paused_ = true;
        return;
    }
    paused_ = false;
    // Audio heard while paused must not count towards the next wake word.
    resetRecognizer();
    detector_.resync(windowEnd_);
    lastScoreAt_.reset();
}

void SessionStateMachine::flush(FinalizeReason reason) {
    if (state_ == State::Listening && session_) {
        finalize(reason);
    }
}

void SessionStateMachine::resetRecognizer() {
    try {
        recognizer_.reset();
    } catch (const RecognizerFault& e) {
        Log::error("Session", std::string("Recognizer reset failed: ") + e.what());
    }
}

} // namespace wakescribe
