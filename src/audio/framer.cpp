#include "audio/framer.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace wakescribe {

static std::size_t windowSamples(int sampleRate, int windowMs) {
    if (sampleRate <= 0 || windowMs <= 0) {
        throw std::invalid_argument("Framer needs a positive sample rate and window length");
    }
    return static_cast<std::size_t>(static_cast<long long>(sampleRate) * windowMs / 1000);
}

Framer::Framer(int sampleRate, int windowMs)
    : sampleRate_(sampleRate), window_(windowSamples(sampleRate, windowMs)) {}

void Framer::push(const AudioFrame& frame) {
    if (frame.sampleRate != sampleRate_) {
        throw std::invalid_argument("Frame at " + std::to_string(frame.sampleRate) +
                                    " Hz pushed into a " + std::to_string(sampleRate_) + " Hz window");
    }
    window_.push(frame.samples.data(), frame.samples.size());
    lastCapturedAt_ = frame.capturedAt;
    lastWallTime_ = frame.wallTime;
}

WindowSlice Framer::snapshot() const {
    return sliceSince(0);
}

WindowSlice Framer::sliceSince(std::uint64_t sampleIndex) const {
    WindowSlice slice;
    slice.sampleRate = sampleRate_;
    slice.end = window_.totalPushed();
    slice.endCapturedAt = lastCapturedAt_;
    slice.endWallTime = lastWallTime_;

    const std::uint64_t oldest = slice.end - window_.size();
    slice.begin = std::max(sampleIndex, oldest);
    if (slice.begin > slice.end) slice.begin = slice.end;
    window_.copyLast(static_cast<std::size_t>(slice.end - slice.begin), slice.samples);
    return slice;
}

std::chrono::milliseconds Framer::buffered() const {
    return std::chrono::milliseconds(static_cast<long long>(window_.size()) * 1000 / sampleRate_);
}

} // namespace wakescribe
