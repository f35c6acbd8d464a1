#pragma once
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace wakescribe {

using SteadyClock = std::chrono::steady_clock;
using WallClock = std::chrono::system_clock;

// One fixed-length block of signed 16-bit mono PCM.
struct AudioFrame {
    std::vector<int16_t> samples;
    int sampleRate{16000};
    SteadyClock::time_point capturedAt{};
    WallClock::time_point wallTime{};
    bool dropout{false}; // zero-filled in place of a lost buffer

    std::chrono::milliseconds duration() const {
        if (sampleRate <= 0) return std::chrono::milliseconds(0);
        return std::chrono::milliseconds(
            static_cast<long long>(samples.size()) * 1000 / sampleRate);
    }
};

inline float compute_rms(const int16_t* samples, std::size_t n) {
    if (!samples || n == 0) return 0.0f;
    double acc = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const double s = static_cast<double>(samples[i]) / 32768.0;
        acc += s * s;
    }
    return static_cast<float>(std::sqrt(acc / static_cast<double>(n)));
}

// RMS level in dBFS, -100 for digital silence.
inline float compute_dbfs(const int16_t* samples, std::size_t n) {
    const float r = compute_rms(samples, n);
    return (r > 0.0f) ? 20.0f * std::log10(r) : -100.0f;
}

} // namespace wakescribe
