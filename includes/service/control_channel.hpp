#pragma once
#include <atomic>
#include <optional>

namespace wakescribe {

enum class ControlCommand { None = 0, Pause, Resume, TogglePause, Reload, LogStatus };

// Single-slot mailbox from control threads to the audio loop. A post fails
// while the previous command is still unread.
class ControlChannel {
public:
    bool post(ControlCommand cmd) {
        if (cmd == ControlCommand::None) return false;
        int expected = static_cast<int>(ControlCommand::None);
        return slot_.compare_exchange_strong(expected, static_cast<int>(cmd));
    }

    std::optional<ControlCommand> take() {
        int v = slot_.exchange(static_cast<int>(ControlCommand::None));
        if (v == static_cast<int>(ControlCommand::None)) return std::nullopt;
        return static_cast<ControlCommand>(v);
    }

    bool empty() const { return slot_.load() == static_cast<int>(ControlCommand::None); }

private:
    std::atomic<int> slot_{static_cast<int>(ControlCommand::None)};
};

} // namespace wakescribe
