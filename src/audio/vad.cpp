#include "audio/vad.hpp"
#include "audio/audio_frame.hpp"

namespace wakescribe {

bool EnergyVAD::process(const int16_t* samples, std::size_t frames) {
    const float db = compute_dbfs(samples, frames);

    // EMA smoothing with faster decay when we are currently in speech
    const float alphaAttack  = 0.30f;
    const float alphaRelease = state_ ? 0.20f : 0.05f;
    if (db > ema_) ema_ = alphaAttack * db + (1.0f - alphaAttack) * ema_;
    else           ema_ = alphaRelease * db + (1.0f - alphaRelease) * ema_;

    const bool enterSpeech = (ema_ >= config_.attackDb);
    const bool keepSpeech  = (ema_ >= config_.releaseDb);

    if (!state_) {
        if (enterSpeech) {
            state_ = true;
            hangSamplesLeft_ = hangoverSamplesTotal_;
        }
    } else {
        if (keepSpeech) {
            hangSamplesLeft_ = hangoverSamplesTotal_;
        } else {
            hangSamplesLeft_ -= static_cast<int>(frames);
            if (hangSamplesLeft_ <= 0) {
                state_ = false;
                hangSamplesLeft_ = 0;
            }
        }
    }

    return state_;
}

} // namespace wakescribe
