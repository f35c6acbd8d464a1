#pragma once

namespace wakescribe {

// Process lifecycle. Paused is a sub-state of Running: capture continues,
// detection and recognition are ignored.
enum class ServiceState {
    Starting,
    Running,
    Paused,
    Stopping,
    Stopped
};

inline const char* toString(ServiceState s) {
    switch (s) {
        case ServiceState::Starting: return "starting";
        case ServiceState::Running:  return "running";
        case ServiceState::Paused:   return "paused";
        case ServiceState::Stopping: return "stopping";
        case ServiceState::Stopped:  return "stopped";
    }
    return "unknown";
}

struct ServiceStatus {
    ServiceState state{ServiceState::Stopped};
    bool sessionActive{false};
    bool streamDegraded{false};
};

} // namespace wakescribe
