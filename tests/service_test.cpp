#include "service/service.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <thread>

using namespace wakescribe;
using namespace wakescribe::test;

namespace {

class ServiceTest : public ::testing::Test {
protected:
    ServiceTest() {
        machineConfig.scoreIntervalMs = 0;
        machineConfig.sampleRate = kRate;
        serviceConfig.initialBackoffMs = 1;
        serviceConfig.maxBackoffMs = 2;
    }

    Service& service() {
        if (!service_) {
            machine_ = std::make_unique<SessionStateMachine>(
                machineConfig, WakeWordSpec({"hey computer", "wake up"}), recognizer, writer, sink);
            service_ = std::make_unique<Service>(serviceConfig, source, framer, *machine_, writer, sink);
        }
        return *service_;
    }

    void stopWhenScriptEnds() {
        source.onExhausted = [this] { service().requestStop(); };
    }

    std::string transcript() {
        return readFile(writer.pathFor(wallOrigin()));
    }

    static std::string line(int atMs, const std::string& text) {
        return TranscriptWriter::formatLine({wallOrigin() + std::chrono::milliseconds(atMs), text});
    }

    SessionStateMachine::Config machineConfig;
    Service::Config serviceConfig;
    TempDir dir;
    FakeAudioSource source;
    ScriptedRecognizer recognizer{defaultVocab()};
    TranscriptWriter writer{dir.str()};
    RecordingSink sink;
    Framer framer{kRate, 1500};

private:
    std::unique_ptr<SessionStateMachine> machine_;
    std::unique_ptr<Service> service_;
};

} // namespace

TEST_F(ServiceTest, StopDuringSessionFlushesSpeech) {
    source.say({Hey, Computer, Turn, On});
    stopWhenScriptEnds();

    service().start();
    EXPECT_EQ(service().status().state, ServiceState::Running);
    EXPECT_EQ(service().run(), kExitOk);

    EXPECT_EQ(transcript(), line(100, "turn on"));
    ASSERT_EQ(sink.ends().size(), 1u);
    EXPECT_EQ(sink.ends()[0].reason, FinalizeReason::Stop);
    EXPECT_EQ(sink.states(), (std::vector<ServiceState>{ServiceState::Starting, ServiceState::Running,
                                                        ServiceState::Stopping, ServiceState::Stopped}));
    EXPECT_EQ(service().status().state, ServiceState::Stopped);
    EXPECT_FALSE(service().status().sessionActive);
    EXPECT_EQ(source.closes, 1);
}

TEST_F(ServiceTest, StopBeforeRunShutsDownOnce) {
    service().start();
    service().requestStop();
    service().requestStop();

    EXPECT_EQ(service().run(), kExitOk);
    EXPECT_EQ(sink.states(), (std::vector<ServiceState>{ServiceState::Starting, ServiceState::Running,
                                                        ServiceState::Stopping, ServiceState::Stopped}));
    EXPECT_EQ(service().framesProcessed(), 0u);
    EXPECT_EQ(source.closes, 1);
}

TEST_F(ServiceTest, StopDuringStartIsNotOverwrittenByRunning) {
    source.onOpen = [this] { service().requestStop(); };

    service().start();
    EXPECT_EQ(service().status().state, ServiceState::Stopping);

    EXPECT_EQ(service().run(), kExitOk);
    EXPECT_EQ(sink.states(), (std::vector<ServiceState>{ServiceState::Starting, ServiceState::Stopping,
                                                        ServiceState::Stopped}));
}

TEST_F(ServiceTest, StopWhilePausingKeepsStopping) {
    // Pausing flushes the open session; the stop lands before the state flips.
    sink.afterSessionEnd = [this] { service().requestStop(); };
    source.say({Hey, Computer, Turn});
    source.then([&] { EXPECT_TRUE(service().pause()); }, On);

    service().start();
    EXPECT_EQ(service().run(), kExitOk);

    ASSERT_EQ(sink.ends().size(), 1u);
    EXPECT_EQ(sink.ends()[0].reason, FinalizeReason::Pause);
    const auto states = sink.states();
    EXPECT_EQ(std::count(states.begin(), states.end(), ServiceState::Paused), 0);
    EXPECT_EQ(states, (std::vector<ServiceState>{ServiceState::Starting, ServiceState::Running,
                                                 ServiceState::Stopping, ServiceState::Stopped}));
}

TEST_F(ServiceTest, DeviceUnavailableAtStartIsFatal) {
    source.failOpen = true;
    EXPECT_THROW(service().start(), DeviceUnavailable);
    EXPECT_EQ(service().status().state, ServiceState::Stopped);
    EXPECT_EQ(sink.states(), (std::vector<ServiceState>{ServiceState::Starting, ServiceState::Stopped}));
}

TEST_F(ServiceTest, TransientStreamErrorsDropFramesOnly) {
    serviceConfig.maxStreamErrors = 5;
    source.say({Hey});
    source.errors(3);
    source.say({Computer, Turn});
    stopWhenScriptEnds();

    service().start();
    EXPECT_EQ(service().run(), kExitOk);

    EXPECT_EQ(source.opens, 1);
    EXPECT_TRUE(sink.faults().empty());
    EXPECT_EQ(service().framesProcessed(), 3u);
    // The session survived the dropped frames.
    ASSERT_EQ(sink.ends().size(), 1u);
    EXPECT_EQ(sink.ends()[0].text, "turn");
}

TEST_F(ServiceTest, PersistentStreamErrorsReopenDevice) {
    serviceConfig.maxStreamErrors = 2;
    serviceConfig.deviceSelector = "usb";
    source.say({Hey, Computer, Turn});
    source.errors(3);
    source.say({Music});
    stopWhenScriptEnds();

    service().start();
    EXPECT_EQ(service().run(), kExitOk);

    EXPECT_EQ(source.opens, 2);
    EXPECT_EQ(source.closes, 2);
    EXPECT_EQ(source.lastSelector, std::string("usb"));
    auto faults = sink.faults();
    ASSERT_EQ(faults.size(), 1u);
    EXPECT_TRUE(faults[0].second);

    // In-flight speech is written before the device is reopened.
    ASSERT_EQ(sink.ends().size(), 1u);
    EXPECT_EQ(sink.ends()[0].reason, FinalizeReason::StreamLost);
    EXPECT_EQ(transcript(), line(100, "turn"));
    EXPECT_FALSE(service().status().streamDegraded);
}

TEST_F(ServiceTest, ExhaustedReopenAttemptsExitWithStreamLost) {
    serviceConfig.maxStreamErrors = 0;
    serviceConfig.maxReopenAttempts = 2;
    source.failReopen = true;
    source.say({Hey});
    source.errors(1);

    service().start();
    EXPECT_EQ(service().run(), kExitStreamLost);

    EXPECT_EQ(source.openAttempts, 3);
    EXPECT_EQ(service().status().state, ServiceState::Stopped);
}

TEST_F(ServiceTest, StopInterruptsReopenBackoff) {
    serviceConfig.maxStreamErrors = 0;
    serviceConfig.maxReopenAttempts = 0; // forever
    serviceConfig.initialBackoffMs = 60000;
    serviceConfig.maxBackoffMs = 60000;
    source.failReopen = true;
    source.errors(1);

    service().start();
    std::thread stopper([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        service().requestStop();
    });
    const auto t0 = std::chrono::steady_clock::now();
    const int code = service().run();
    stopper.join();

    EXPECT_EQ(code, kExitOk);
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(10));
    EXPECT_EQ(service().status().state, ServiceState::Stopped);
}

TEST_F(ServiceTest, PauseAndResumeThroughControlChannel) {
    bool activeSeen = false;
    bool pausedSeen = false;

    source.say({Hey, Computer});
    source.then([&] {
        activeSeen = service().status().sessionActive;
        EXPECT_TRUE(service().pause());
    }, Turn);
    source.say({Wake, Up});
    source.then([&] {
        pausedSeen = service().status().state == ServiceState::Paused;
        EXPECT_TRUE(service().resume());
    });
    source.say({Hey, Computer, Music});
    stopWhenScriptEnds();

    service().start();
    EXPECT_EQ(service().run(), kExitOk);

    EXPECT_TRUE(activeSeen);
    EXPECT_TRUE(pausedSeen);
    ASSERT_EQ(sink.ends().size(), 2u);
    EXPECT_EQ(sink.ends()[0].reason, FinalizeReason::Pause);
    EXPECT_EQ(sink.ends()[0].text, "turn");
    EXPECT_EQ(sink.ends()[1].reason, FinalizeReason::Stop);
    EXPECT_EQ(sink.ends()[1].text, "music");
    // "wake up" was spoken while paused.
    EXPECT_EQ(sink.detections().size(), 2u);

    auto states = sink.states();
    auto paused = std::find(states.begin(), states.end(), ServiceState::Paused);
    ASSERT_NE(paused, states.end());
    ASSERT_NE(paused + 1, states.end());
    EXPECT_EQ(*(paused + 1), ServiceState::Running);
}

TEST_F(ServiceTest, TogglePauseFlipsState) {
    bool pausedSeen = false;
    source.then([&] { EXPECT_TRUE(service().togglePause()); });
    source.then([&] {
        pausedSeen = service().status().state == ServiceState::Paused;
        EXPECT_TRUE(service().togglePause());
    });
    source.then([&] { EXPECT_TRUE(service().logStatus()); });
    stopWhenScriptEnds();

    service().start();
    EXPECT_EQ(service().run(), kExitOk);
    EXPECT_TRUE(pausedSeen);
    const auto states = sink.states();
    EXPECT_EQ(std::count(states.begin(), states.end(), ServiceState::Paused), 1);
}

TEST_F(ServiceTest, ReloadReopensTranscriptAfterRotation) {
    source.say({Hey, Computer, Turn});
    source.silence(25);
    source.then([&] {
        std::filesystem::remove(writer.pathFor(wallOrigin()));
        EXPECT_TRUE(service().reload());
    });
    source.say({Wake, Up, Music});
    stopWhenScriptEnds();

    service().start();
    EXPECT_EQ(service().run(), kExitOk);

    ASSERT_EQ(sink.ends().size(), 2u);
    const std::string text = transcript();
    EXPECT_EQ(text.find("turn"), std::string::npos);
    EXPECT_NE(text.find("] music\n"), std::string::npos);
}
