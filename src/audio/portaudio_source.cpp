#include "audio/portaudio_source.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>
#include <stdexcept>

namespace wakescribe {

PortAudioSource::PortAudioSource(const Config& config) : config_(config) {
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw DeviceUnavailable("Failed to initialize PortAudio: " +
                                std::string(Pa_GetErrorText(err)));
    }
}

PortAudioSource::~PortAudioSource() {
    close();
    Pa_Terminate();
}

std::vector<AudioDevice> PortAudioSource::listDevices() {
    std::vector<AudioDevice> devices;
    int numDevices = Pa_GetDeviceCount();

    for (int i = 0; i < numDevices; i++) {
        const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(i);
        if (deviceInfo && deviceInfo->maxInputChannels > 0) {
            AudioDevice device;
            device.index = i;
            device.name = deviceInfo->name;
            device.maxInputChannels = deviceInfo->maxInputChannels;
            device.defaultSampleRate = deviceInfo->defaultSampleRate;
            devices.push_back(device);
        }
    }

    return devices;
}

std::string PortAudioSource::describe(const AudioDevice& device) {
    std::ostringstream oss;
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device.index);
    const PaHostApiInfo* api = info ? Pa_GetHostApiInfo(info->hostApi) : nullptr;
    oss << "[" << device.index << "] " << device.name
        << " - API: " << (api ? api->name : "?")
        << ", inCh: " << device.maxInputChannels
        << ", defaultSR: " << device.defaultSampleRate;
    return oss.str();
}

void PortAudioSource::open(const std::optional<std::string>& deviceSelector) {
    if (stream_) {
        throw DeviceUnavailable("Stream already open");
    }

    int device = resolveDeviceSelector(listDevices(), deviceSelector, Pa_GetDefaultInputDevice());
    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(device);
    if (!deviceInfo) {
        throw DeviceUnavailable("Could not get device info for device " + std::to_string(device));
    }

    PaStreamParameters inputParams{};
    inputParams.device = device;
    inputParams.channelCount = 1;
    inputParams.sampleFormat = paInt16;
    inputParams.suggestedLatency = deviceInfo->defaultHighInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    PaError err = Pa_IsFormatSupported(&inputParams, nullptr, config_.sampleRate);
    if (err != paFormatIsSupported) {
        throw DeviceUnavailable(std::string(deviceInfo->name) + " does not support mono " +
                                std::to_string(config_.sampleRate) + " Hz: " + Pa_GetErrorText(err));
    }

    // No callback: the audio loop pulls frames with Pa_ReadStream.
    err = Pa_OpenStream(&stream_,
                        &inputParams,
                        nullptr,
                        config_.sampleRate,
                        config_.framesPerBuffer,
                        paClipOff,
                        nullptr,
                        nullptr);
    if (err != paNoError) {
        stream_ = nullptr;
        throw DeviceUnavailable(std::string("Pa_OpenStream failed: ") + Pa_GetErrorText(err));
    }

    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw DeviceUnavailable(std::string("Pa_StartStream failed: ") + Pa_GetErrorText(err));
    }

    deviceName_ = deviceInfo->name;
    overflows_ = 0;
    Log::info("Audio", "Capturing from [" + std::to_string(device) + "] " + deviceName_ + " at " +
                       std::to_string(config_.sampleRate) + " Hz");
}

AudioFrame PortAudioSource::readFrame() {
    if (!stream_) {
        throw StreamError("Stream not open");
    }

    AudioFrame frame;
    frame.sampleRate = config_.sampleRate;
    frame.samples.resize(config_.framesPerBuffer);

    // Wait for a full buffer, but never longer than one frame plus the stall timeout.
    const auto deadline = SteadyClock::now() + frame.duration() +
                          std::chrono::milliseconds(config_.stallTimeoutMs);
    for (;;) {
        signed long available = Pa_GetStreamReadAvailable(stream_);
        if (available < 0) {
            throw StreamError(std::string("Input stream lost: ") +
                              Pa_GetErrorText(static_cast<PaError>(available)));
        }
        if (static_cast<unsigned long>(available) >= config_.framesPerBuffer) break;
        if (SteadyClock::now() > deadline) {
            throw StreamError("No audio from " + deviceName_ + " for " +
                              std::to_string(config_.stallTimeoutMs) + " ms");
        }
        Pa_Sleep(5);
    }

    PaError err = Pa_ReadStream(stream_, frame.samples.data(), config_.framesPerBuffer);
    frame.capturedAt = SteadyClock::now();
    frame.wallTime = WallClock::now();

    if (err == paInputOverflowed) {
        ++overflows_;
        Log::warn("Audio", "Input overflow (" + std::to_string(overflows_) + " so far), frame dropped");
        std::fill(frame.samples.begin(), frame.samples.end(), int16_t{0});
        frame.dropout = true;
    } else if (err != paNoError) {
        throw StreamError(std::string("Pa_ReadStream failed: ") + Pa_GetErrorText(err));
    }
    return frame;
}

void PortAudioSource::close() {
    if (stream_) {
        Pa_AbortStream(stream_);
        Pa_CloseStream(stream_);
        stream_ = nullptr;
    }
}

} // namespace wakescribe
