#pragma once
#include "asr/recognizer.hpp"
#include "audio/framer.hpp"
#include "wake/wake_word_spec.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace wakescribe {

struct DetectionEvent {
    std::string keyword;
    float confidence{0.0f};
    WallClock::time_point timestamp{};
};

// Scores the rolling window by running the shared recognizer over the audio it
// has not seen yet and matching the partial hypothesis against the wake words.
class WakeWordDetector {
public:
    struct Config {
        float threshold = 0.8f;
        int idleResetMs = 3000;              // reset a hypothesis that stopped changing
        std::size_t maxHypothesisWords = 24; // reset a hypothesis that grew this long
    };

    WakeWordDetector(Recognizer& recognizer, const Config& config);

    // Throws RecognizerFault.
    std::optional<DetectionEvent> score(const WindowSlice& window, const WakeWordSpec& spec);

    // Longest matching keyword wins, then earliest configured.
    std::optional<DetectionEvent> match(const std::string& hypothesis,
                                        const WakeWordSpec& spec,
                                        WallClock::time_point at) const;

    // Removes everything up to and including `keyword` from `text`.
    std::string stripKeyword(const std::string& text, const std::string& keyword) const;

    // Skip audio up to `windowEnd`; it was consumed elsewhere.
    void resync(std::uint64_t windowEnd);

    std::uint64_t cursor() const { return cursor_; }
    float threshold() const { return config_.threshold; }
    const std::string& lastHypothesis() const { return lastHypothesis_; }

private:
    Recognizer& recognizer_;
    Config config_;
    std::uint64_t cursor_{0};
    std::string lastHypothesis_;
    SteadyClock::time_point lastChangeAt_{};
};

} // namespace wakescribe
