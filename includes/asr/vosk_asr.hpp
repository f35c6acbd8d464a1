#pragma once

#include "asr/recognizer.hpp"

#include <memory>
#include <string>
#include <vosk_api.h>

namespace wakescribe {

class VoskASR : public Recognizer {
public:
    struct Config {
        std::string modelPath;
        float sampleRate{16000.0f};
    };

    // Throws ModelUnavailable when the model cannot be loaded.
    explicit VoskASR(const Config& config);

    void acceptFrame(const int16_t* samples, std::size_t count) override;
    std::string partialResult() override;
    std::string finalResult() override;
    void reset() override;

private:
    // Vosk returns JSON such as {"partial": "..."} or {"text": "..."}.
    static std::string field(const char* json, const char* key);
    std::string joined(const std::string& tail) const;

    Config config_;
    struct VoskModelDeleter {
        void operator()(VoskModel* p) { if (p) vosk_model_free(p); }
    };
    struct VoskRecognizerDeleter {
        void operator()(VoskRecognizer* p) { if (p) vosk_recognizer_free(p); }
    };

    std::unique_ptr<VoskModel, VoskModelDeleter> model_;
    std::unique_ptr<VoskRecognizer, VoskRecognizerDeleter> recognizer_;

    // Utterances Vosk already endpointed since the last reset.
    std::string committed_;
};

} // namespace wakescribe
