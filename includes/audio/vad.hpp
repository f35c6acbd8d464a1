#pragma once
#include <cstddef>
#include <cstdint>

namespace wakescribe {

// Energy-based VAD with hysteresis + hangover, used to decide whether a frame
// inside a session "has speech". Hangover is tracked in samples.
class EnergyVAD {
public:
    struct Config {
        float attackDb = -40.0f;   // EMA level that enters speech
        float releaseDb = -50.0f;  // EMA level that keeps speech
        int hangoverMs = 300;
    };

    EnergyVAD(int sampleRate, const Config& config)
        : config_(config),
          hangoverSamplesTotal_(static_cast<int>(config.hangoverMs * 1e-3 * sampleRate)) {}

    bool process(const int16_t* samples, std::size_t frames);

    void reset() { state_ = false; hangSamplesLeft_ = 0; ema_ = -100.0f; }
    bool isSpeech() const { return state_; }
    float emaDb() const { return ema_; }

private:
    Config config_;
    int hangoverSamplesTotal_;

    int hangSamplesLeft_ = 0;
    bool state_ = false;
    float ema_ = -100.0f;
};

} // namespace wakescribe
