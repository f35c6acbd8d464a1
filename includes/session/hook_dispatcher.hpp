#pragma once
#include "session/notification.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace wakescribe {

// Forwards events to the registered sinks on its own thread so the audio loop
// never waits on an indicator. When the queue is full new events are dropped.
class HookDispatcher : public NotificationSink {
public:
    explicit HookDispatcher(std::size_t capacity = 64);
    ~HookDispatcher() override;
    HookDispatcher(const HookDispatcher&) = delete;
    HookDispatcher& operator=(const HookDispatcher&) = delete;

    // Register before start().
    void addSink(std::shared_ptr<NotificationSink> sink);

    void start();
    // Delivers what is already queued, then joins the worker.
    void stop();

    void onWakeWordDetected(const DetectionEvent& event) override;
    void onSessionStart(const SessionInfo& info) override;
    void onSessionEnd(const SessionSummary& summary) override;
    void onServiceStateChanged(ServiceState state) override;
    void onStreamFault(const std::string& what, bool persistent) override;

    std::size_t dropped() const { return dropped_.load(); }

private:
    using Event = std::function<void(NotificationSink&)>;

    void post(Event event);
    void run();

    std::size_t capacity_;
    std::vector<std::shared_ptr<NotificationSink>> sinks_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    bool running_{false};
    std::thread thread_;
    std::atomic<std::size_t> dropped_{0};
};

} // namespace wakescribe
