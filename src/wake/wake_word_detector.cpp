#include "wake/wake_word_detector.hpp"
#include "core/log.hpp"
#include "wake/phrase_match.hpp"

#include <algorithm>
#include <chrono>

namespace wakescribe {

WakeWordDetector::WakeWordDetector(Recognizer& recognizer, const Config& config)
    : recognizer_(recognizer), config_(config) {}

std::optional<DetectionEvent> WakeWordDetector::score(const WindowSlice& window,
                                                      const WakeWordSpec& spec) {
    if (cursor_ < window.begin && cursor_ != 0) {
        Log::debug("Wake", "Window overran the detector by " +
                           std::to_string(window.begin - cursor_) + " samples");
    }
    const std::uint64_t from = std::max(cursor_, window.begin);
    if (from < window.end) {
        const auto offset = static_cast<std::size_t>(from - window.begin);
        recognizer_.acceptFrame(window.samples.data() + offset, window.samples.size() - offset);
    }
    cursor_ = std::max(cursor_, window.end);

    std::string hypothesis = recognizer_.partialResult();
    if (hypothesis != lastHypothesis_) {
        lastHypothesis_ = hypothesis;
        lastChangeAt_ = window.endCapturedAt;
    }

    auto event = match(hypothesis, spec, window.endWallTime);
    if (event) {
        Log::debug("Wake", "Keyword '" + event->keyword + "' in '" + hypothesis + "' (confidence " +
                          std::to_string(event->confidence) + ")");
        return event;
    }

    if (!hypothesis.empty()) {
        const bool stale = window.endCapturedAt - lastChangeAt_ >=
                           std::chrono::milliseconds(config_.idleResetMs);
        const bool tooLong = tokenize(hypothesis).size() > config_.maxHypothesisWords;
        if (stale || tooLong) {
            Log::debug("Wake", "Discarding idle hypothesis '" + hypothesis + "'");
            recognizer_.reset();
            lastHypothesis_.clear();
            lastChangeAt_ = window.endCapturedAt;
        }
    }
    return std::nullopt;
}

std::optional<DetectionEvent> WakeWordDetector::match(const std::string& hypothesis,
                                                      const WakeWordSpec& spec,
                                                      WallClock::time_point at) const {
    const std::string text = normalize_text(hypothesis);
    if (text.empty()) return std::nullopt;

    std::optional<DetectionEvent> best;
    for (const auto& keyword : spec.keywords()) {
        auto m = find_keyword(text, keyword, config_.threshold);
        if (!m) continue;
        // Strictly longer replaces; equal length keeps the earlier keyword.
        if (!best || keyword.size() > best->keyword.size()) {
            best = DetectionEvent{keyword, m->confidence, at};
        }
    }
    return best;
}

std::string WakeWordDetector::stripKeyword(const std::string& text, const std::string& keyword) const {
    const std::string normalized = normalize_text(text);
    auto m = find_keyword(normalized, normalize_text(keyword), config_.threshold);
    if (!m) return normalized;

    const auto tokens = tokenize(normalized);
    std::string rest;
    for (std::size_t i = m->end; i < tokens.size(); ++i) {
        if (!rest.empty()) rest.push_back(' ');
        rest += tokens[i];
    }
    return rest;
}

void WakeWordDetector::resync(std::uint64_t windowEnd) {
    cursor_ = windowEnd;
    lastHypothesis_.clear();
}

} // namespace wakescribe
