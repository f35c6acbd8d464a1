#include "asr/vosk_asr.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <filesystem>
#include <nlohmann/json.hpp>

namespace wakescribe {

VoskASR::VoskASR(const Config& config) : config_(config) {
    vosk_set_log_level(-1); // Reduce logging

    if (!std::filesystem::is_directory(config_.modelPath)) {
        throw ModelUnavailable("Vosk model directory not found: " + config_.modelPath);
    }

    auto* model = vosk_model_new(config_.modelPath.c_str());
    if (!model) {
        throw ModelUnavailable("Failed to load Vosk model from " + config_.modelPath);
    }
    model_.reset(model);

    auto* recognizer = vosk_recognizer_new(model_.get(), config_.sampleRate);
    if (!recognizer) {
        throw ModelUnavailable("Failed to create Vosk recognizer");
    }
    recognizer_.reset(recognizer);

    Log::info("ASR", "Loaded Vosk model " + config_.modelPath);
}

std::string VoskASR::field(const char* json, const char* key) {
    if (!json) {
        throw RecognizerFault("Vosk returned no result");
    }
    try {
        auto parsed = nlohmann::json::parse(json);
        return parsed.value(key, std::string{});
    } catch (const nlohmann::json::exception& e) {
        throw RecognizerFault(std::string("Unreadable Vosk result: ") + e.what());
    }
}

std::string VoskASR::joined(const std::string& tail) const {
    if (committed_.empty()) return tail;
    if (tail.empty()) return committed_;
    return committed_ + " " + tail;
}

void VoskASR::acceptFrame(const int16_t* samples, std::size_t count) {
    if (count == 0) return;
    int rc = vosk_recognizer_accept_waveform_s(recognizer_.get(),
                                               reinterpret_cast<const short*>(samples),
                                               static_cast<int>(count));
    if (rc < 0) {
        throw RecognizerFault("vosk_recognizer_accept_waveform_s failed");
    }
    if (rc == 1) {
        // Endpoint: Vosk moves the utterance into Result() and clears its partial.
        std::string text = field(vosk_recognizer_result(recognizer_.get()), "text");
        if (!text.empty()) committed_ = joined(text);
    }
}

std::string VoskASR::partialResult() {
    return joined(field(vosk_recognizer_partial_result(recognizer_.get()), "partial"));
}

std::string VoskASR::finalResult() {
    return joined(field(vosk_recognizer_final_result(recognizer_.get()), "text"));
}

void VoskASR::reset() {
    vosk_recognizer_reset(recognizer_.get());
    committed_.clear();
}

} // namespace wakescribe
