#pragma once
#include <stdexcept>
#include <string>

namespace wakescribe {

// No usable input device. Fatal at startup.
class DeviceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// I/O fault on an open stream.
class StreamError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The recognizer failed to process audio or produce a result.
class RecognizerFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Recognizer model missing or unloadable. Fatal at startup.
class ModelUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A transcript entry could not be persisted.
class WriteFailure : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid configuration value.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace wakescribe
