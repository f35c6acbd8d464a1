#pragma once
#include "audio/audio_source.hpp"

#include <portaudio.h>
#include <string>
#include <vector>

namespace wakescribe {

// Blocking-read PortAudio input stream, paInt16 mono.
class PortAudioSource : public AudioSource {
public:
    struct Config {
        int sampleRate{16000};
        unsigned long framesPerBuffer{1600}; // 100 ms @ 16k
        int stallTimeoutMs{1000};            // beyond one frame duration
    };

    explicit PortAudioSource(const Config& config);
    ~PortAudioSource() override;
    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    std::vector<AudioDevice> listDevices() override;
    void open(const std::optional<std::string>& deviceSelector) override;
    AudioFrame readFrame() override;
    void close() override;
    bool isOpen() const override { return stream_ != nullptr; }

    const std::string& deviceName() const { return deviceName_; }

    // One-line description, e.g. "[3] USB Mic - API: ALSA, inCh: 1, defaultSR: 48000".
    static std::string describe(const AudioDevice& device);

private:
    Config config_;
    PaStream* stream_{nullptr};
    std::string deviceName_;
    unsigned long overflows_{0};
};

} // namespace wakescribe
