#pragma once
#include "audio/audio_frame.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wakescribe {

struct AudioDevice {
    int index;
    std::string name;
    int maxInputChannels;
    double defaultSampleRate;
};

// Microphone stream delivering fixed-size frames at a fixed rate.
class AudioSource {
public:
    virtual ~AudioSource() = default;

    virtual std::vector<AudioDevice> listDevices() = 0;

    // Throws DeviceUnavailable.
    virtual void open(const std::optional<std::string>& deviceSelector) = 0;

    // Blocks for the next frame. Transient driver faults yield a zeroed frame
    // with `dropout` set. Throws StreamError when the stream is lost or stalls.
    virtual AudioFrame readFrame() = 0;

    virtual void close() = 0;
    virtual bool isOpen() const = 0;
};

// Resolves a selector to a device index: nullopt -> defaultIndex, digits -> that
// index, anything else -> the device with exactly that name, else the first one
// whose name contains it (both case-insensitive).
// Throws DeviceUnavailable when nothing matches.
int resolveDeviceSelector(const std::vector<AudioDevice>& devices,
                          const std::optional<std::string>& selector,
                          int defaultIndex);

// Selector for a remembered device: the saved index while the device at that
// index still carries the saved name, the name otherwise.
std::string savedDeviceSelector(const std::vector<AudioDevice>& devices,
                                int savedIndex,
                                const std::string& savedName);

} // namespace wakescribe
