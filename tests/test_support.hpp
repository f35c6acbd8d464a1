#pragma once
#include "asr/recognizer.hpp"
#include "audio/audio_frame.hpp"
#include "audio/audio_source.hpp"
#include "core/errors.hpp"
#include "session/notification.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <unistd.h>
#include <vector>

namespace wakescribe::test {

constexpr int kRate = 16000;
constexpr int kFrameSamples = 1600; // 100 ms

// Fixed origin so timestamps in assertions are reproducible.
inline WallClock::time_point wallOrigin() {
    return WallClock::time_point(std::chrono::seconds(1773489600)); // 2026-03-14 12:00:00 UTC
}

inline SteadyClock::time_point steadyOrigin() {
    return SteadyClock::time_point(std::chrono::hours(1));
}

// A frame whose samples all carry `marker`. The scripted recognizer reads a
// marker as one spoken word; 0 is silence.
inline AudioFrame makeFrame(int16_t marker, int atMs) {
    AudioFrame f;
    f.samples.assign(kFrameSamples, marker);
    f.sampleRate = kRate;
    f.capturedAt = steadyOrigin() + std::chrono::milliseconds(atMs);
    f.wallTime = wallOrigin() + std::chrono::milliseconds(atMs);
    return f;
}

// Emits vocab[marker] whenever the sample value switches to a non-zero marker.
class ScriptedRecognizer : public Recognizer {
public:
    explicit ScriptedRecognizer(std::vector<std::string> vocab) : vocab_(std::move(vocab)) {}

    void acceptFrame(const int16_t* samples, std::size_t count) override {
        if (failAccept) throw RecognizerFault("scripted accept failure");
        ++acceptCalls;
        samplesFed += count;
        for (std::size_t i = 0; i < count; ++i) {
            const int16_t v = samples[i];
            if (v != prev_ && v > 0 && static_cast<std::size_t>(v) < vocab_.size()) {
                words_.push_back(vocab_[static_cast<std::size_t>(v)]);
            }
            prev_ = v;
        }
    }

    std::string partialResult() override {
        if (failPartial) throw RecognizerFault("scripted partial failure");
        return joined();
    }

    std::string finalResult() override {
        ++finalCalls;
        if (onFinal) onFinal();
        if (failFinal) throw RecognizerFault("scripted final failure");
        return emptyFinal ? std::string{} : joined();
    }

    void reset() override {
        ++resets;
        words_.clear();
        prev_ = 0;
    }

    bool failAccept = false;
    bool failPartial = false;
    bool failFinal = false;
    bool emptyFinal = false;
    std::function<void()> onFinal;

    int acceptCalls = 0;
    int finalCalls = 0;
    int resets = 0;
    std::size_t samplesFed = 0;

private:
    std::string joined() const {
        std::string out;
        for (const auto& w : words_) {
            if (!out.empty()) out.push_back(' ');
            out += w;
        }
        return out;
    }

    std::vector<std::string> vocab_;
    std::vector<std::string> words_;
    int16_t prev_ = 0;
};

// Vocabulary shared by the session and service tests.
inline std::vector<std::string> defaultVocab() {
    return {"", "hey", "computer", "turn", "on", "the", "lights", "wake", "up", "music"};
}

enum Word : int16_t {
    Silence = 0, Hey, Computer, Turn, On, The, Lights, Wake, Up, Music
};

// Records every notification; safe to read from the test thread.
class RecordingSink : public NotificationSink {
public:
    void onWakeWordDetected(const DetectionEvent& event) override {
        std::lock_guard<std::mutex> lock(mutex_);
        detections_.push_back(event);
    }
    void onSessionStart(const SessionInfo& info) override {
        std::lock_guard<std::mutex> lock(mutex_);
        starts_.push_back(info);
    }
    void onSessionEnd(const SessionSummary& summary) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ends_.push_back(summary);
        }
        if (afterSessionEnd) afterSessionEnd();
    }
    void onServiceStateChanged(ServiceState state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        states_.push_back(state);
    }
    void onStreamFault(const std::string& what, bool persistent) override {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_.emplace_back(what, persistent);
    }

    // Runs on the calling thread after each session end is recorded.
    std::function<void()> afterSessionEnd;

    std::vector<DetectionEvent> detections() const { std::lock_guard<std::mutex> l(mutex_); return detections_; }
    std::vector<SessionInfo> starts() const { std::lock_guard<std::mutex> l(mutex_); return starts_; }
    std::vector<SessionSummary> ends() const { std::lock_guard<std::mutex> l(mutex_); return ends_; }
    std::vector<ServiceState> states() const { std::lock_guard<std::mutex> l(mutex_); return states_; }
    std::vector<std::pair<std::string, bool>> faults() const { std::lock_guard<std::mutex> l(mutex_); return faults_; }

private:
    mutable std::mutex mutex_;
    std::vector<DetectionEvent> detections_;
    std::vector<SessionInfo> starts_;
    std::vector<SessionSummary> ends_;
    std::vector<ServiceState> states_;
    std::vector<std::pair<std::string, bool>> faults_;
};

// Scripted microphone. Each step yields a frame or a StreamError; when the
// script runs out `onExhausted` fires and silence follows.
class FakeAudioSource : public AudioSource {
public:
    struct Step {
        int16_t marker = 0;
        bool error = false;
        std::function<void()> action;
    };

    std::vector<AudioDevice> listDevices() override {
        return {{0, "Built-in Microphone", 2, 48000.0}, {1, "USB Headset", 1, 16000.0}};
    }

    void open(const std::optional<std::string>& selector) override {
        ++openAttempts;
        if (onOpen) onOpen();
        const bool fail = failOpen || (failReopen && opens > 0);
        if (fail) throw DeviceUnavailable("scripted open failure");
        lastSelector = selector;
        ++opens;
        open_ = true;
    }

    AudioFrame readFrame() override {
        if (!open_) throw StreamError("read on closed stream");
        const int at = clockMs_;
        clockMs_ += 100;
        if (script.empty()) {
            if (onExhausted) onExhausted();
            return makeFrame(Silence, at);
        }
        Step step = std::move(script.front());
        script.pop_front();
        if (step.action) step.action();
        if (step.error) throw StreamError("scripted stream error");
        return makeFrame(step.marker, at);
    }

    void close() override {
        if (open_) ++closes;
        open_ = false;
    }

    bool isOpen() const override { return open_; }

    void say(std::initializer_list<int16_t> markers) {
        for (int16_t m : markers) script.push_back(Step{m, false, nullptr});
    }
    void silence(int frames) {
        for (int i = 0; i < frames; ++i) script.push_back(Step{Silence, false, nullptr});
    }
    void errors(int count) {
        for (int i = 0; i < count; ++i) script.push_back(Step{Silence, true, nullptr});
    }
    void then(std::function<void()> action, int16_t marker = Silence) {
        script.push_back(Step{marker, false, std::move(action)});
    }

    std::deque<Step> script;
    std::function<void()> onExhausted;
    std::function<void()> onOpen;
    bool failOpen = false;
    bool failReopen = false;
    int openAttempts = 0;
    int opens = 0;
    int closes = 0;
    std::optional<std::string> lastSelector;

private:
    bool open_ = false;
    int clockMs_ = 0;
};

// Scratch directory removed when the test ends.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("wakescribe_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str(const std::string& child = {}) const {
        return child.empty() ? path_.string() : (path_ / child).string();
    }

private:
    std::filesystem::path path_;
};

inline std::string readFile(const std::string& path) {
    std::ifstream f(path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

inline int countFiles(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) return 0;
    int n = 0;
    for (const auto& e : std::filesystem::directory_iterator(dir)) {
        if (e.is_regular_file()) ++n;
    }
    return n;
}

} // namespace wakescribe::test
