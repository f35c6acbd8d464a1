#include "session/hook_dispatcher.hpp"
#include "core/log.hpp"

namespace wakescribe {

HookDispatcher::HookDispatcher(std::size_t capacity) : capacity_(capacity) {}

HookDispatcher::~HookDispatcher() {
    stop();
}

void HookDispatcher::addSink(std::shared_ptr<NotificationSink> sink) {
    if (sink) sinks_.push_back(std::move(sink));
}

void HookDispatcher::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    thread_ = std::thread(&HookDispatcher::run, this);
}

void HookDispatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
}

void HookDispatcher::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        if (queue_.size() >= capacity_) {
            ++dropped_;
            Log::warn("Hooks", "Notification queue full, event dropped");
            return;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void HookDispatcher::run() {
    for (;;) {
        Event event;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (queue_.empty()) return; // stopped and drained
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        for (auto& sink : sinks_) {
            try {
                event(*sink);
            } catch (const std::exception& e) {
                Log::error("Hooks", std::string("Notification sink failed: ") + e.what());
            }
        }
    }
}

void HookDispatcher::onWakeWordDetected(const DetectionEvent& event) {
    post([event](NotificationSink& s) { s.onWakeWordDetected(event); });
}

void HookDispatcher::onSessionStart(const SessionInfo& info) {
    post([info](NotificationSink& s) { s.onSessionStart(info); });
}

void HookDispatcher::onSessionEnd(const SessionSummary& summary) {
    post([summary](NotificationSink& s) { s.onSessionEnd(summary); });
}

void HookDispatcher::onServiceStateChanged(ServiceState state) {
    post([state](NotificationSink& s) { s.onServiceStateChanged(state); });
}

void HookDispatcher::onStreamFault(const std::string& what, bool persistent) {
    post([what, persistent](NotificationSink& s) { s.onStreamFault(what, persistent); });
}

} // namespace wakescribe
