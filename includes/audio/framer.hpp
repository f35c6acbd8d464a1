#pragma once
#include "audio/audio_frame.hpp"
#include "audio/ring_buffer.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

namespace wakescribe {

// Read-only copy of part of the rolling window.
struct WindowSlice {
    std::vector<int16_t> samples;  // oldest first
    std::uint64_t begin{0};        // absolute index of samples.front()
    std::uint64_t end{0};          // one past the newest sample
    int sampleRate{16000};
    SteadyClock::time_point endCapturedAt{};
    WallClock::time_point endWallTime{};
};

// Accumulates frames into the rolling window used for wake-word scoring.
class Framer {
public:
    Framer(int sampleRate, int windowMs);

    void push(const AudioFrame& frame);

    WindowSlice snapshot() const;

    // Samples with absolute index >= sampleIndex that are still buffered.
    WindowSlice sliceSince(std::uint64_t sampleIndex) const;

    std::uint64_t end() const { return window_.totalPushed(); }
    std::size_t capacitySamples() const { return window_.capacity(); }
    std::chrono::milliseconds buffered() const;
    int sampleRate() const { return sampleRate_; }

private:
    int sampleRate_;
    RingBuffer<int16_t> window_;
    SteadyClock::time_point lastCapturedAt_{};
    WallClock::time_point lastWallTime_{};
};

} // namespace wakescribe
