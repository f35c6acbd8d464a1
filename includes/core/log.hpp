#pragma once
#include <fstream>
#include <mutex>
#include <sstream>
#include <string>

namespace wakescribe {

// Line-oriented diagnostics to stderr and, optionally, a log file.
// Format: "YYYY-MM-DD HH:MM:SS LEVEL [component] message"
class Log {
public:
    enum class Level { Debug = 0, Info, Warn, Error };

    static void setLevel(Level level);
    static Level level();

    // Also append every line to `path`. Returns false if the file cannot be opened.
    static bool setFile(const std::string& path);

    static void write(Level level, const std::string& component, const std::string& message);

    static void debug(const std::string& component, const std::string& message) {
        write(Level::Debug, component, message);
    }
    static void info(const std::string& component, const std::string& message) {
        write(Level::Info, component, message);
    }
    static void warn(const std::string& component, const std::string& message) {
        write(Level::Warn, component, message);
    }
    static void error(const std::string& component, const std::string& message) {
        write(Level::Error, component, message);
    }

private:
    static std::mutex& mutex();
    static std::ofstream& file();
};

} // namespace wakescribe
