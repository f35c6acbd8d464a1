#include "audio/audio_source.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <cctype>

namespace wakescribe {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

int resolveDeviceSelector(const std::vector<AudioDevice>& devices,
                          const std::optional<std::string>& selector,
                          int defaultIndex) {
    auto isInput = [&](int index) {
        return std::any_of(devices.begin(), devices.end(),
                           [&](const AudioDevice& d) { return d.index == index && d.maxInputChannels > 0; });
    };

    if (!selector || selector->empty()) {
        if (defaultIndex < 0 || !isInput(defaultIndex)) {
            throw DeviceUnavailable("No default input device available");
        }
        return defaultIndex;
    }

    const std::string& sel = *selector;
    if (std::all_of(sel.begin(), sel.end(), [](unsigned char c) { return std::isdigit(c); })) {
        int index = -1;
        try {
            index = std::stoi(sel);
        } catch (const std::out_of_range&) {
            throw DeviceUnavailable("Input device " + sel + " does not exist");
        }
        if (!isInput(index)) {
            throw DeviceUnavailable("Input device " + sel + " does not exist");
        }
        return index;
    }

    const std::string needle = lower(sel);
    for (const auto& d : devices) {
        if (d.maxInputChannels > 0 && lower(d.name) == needle) return d.index;
    }
    for (const auto& d : devices) {
        if (d.maxInputChannels > 0 && lower(d.name).find(needle) != std::string::npos) {
            return d.index;
        }
    }
    throw DeviceUnavailable("No input device matching '" + sel + "'");
}

std::string savedDeviceSelector(const std::vector<AudioDevice>& devices,
                                int savedIndex,
                                const std::string& savedName) {
    if (savedName.empty()) return std::to_string(savedIndex);
    for (const auto& d : devices) {
        if (d.index == savedIndex && lower(d.name) == lower(savedName)) {
            return std::to_string(savedIndex);
        }
    }
    // Indices shift when devices come and go; fall back to the name.
    return savedName;
}

} // namespace wakescribe
