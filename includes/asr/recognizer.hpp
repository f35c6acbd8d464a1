#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace wakescribe {

// Streaming speech recognizer. All methods may throw RecognizerFault.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // Feed 16-bit mono PCM at the recognizer's sample rate.
    virtual void acceptFrame(const int16_t* samples, std::size_t count) = 0;

    // Best guess for everything fed since the last reset. May change.
    virtual std::string partialResult() = 0;

    // Flush pending audio and return the final hypothesis since the last reset.
    virtual std::string finalResult() = 0;

    // Drop all state so the next utterance starts clean.
    virtual void reset() = 0;
};

} // namespace wakescribe
