#include "core/log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace wakescribe {

namespace {

std::atomic<int> g_level{static_cast<int>(Log::Level::Info)};

const char* levelName(Log::Level level) {
    switch (level) {
        case Log::Level::Debug: return "DEBUG";
        case Log::Level::Info:  return "INFO ";
        case Log::Level::Warn:  return "WARN ";
        case Log::Level::Error: return "ERROR";
    }
    return "?";
}

} // namespace

std::mutex& Log::mutex() {
    static std::mutex m;
    return m;
}

std::ofstream& Log::file() {
    static std::ofstream f;
    return f;
}

void Log::setLevel(Level level) {
    g_level.store(static_cast<int>(level));
}

Log::Level Log::level() {
    return static_cast<Level>(g_level.load());
}

bool Log::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex());
    auto& f = file();
    if (f.is_open()) f.close();
    if (path.empty()) return true;
    f.open(path, std::ios::app);
    return f.is_open();
}

void Log::write(Level level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < g_level.load()) return;

    std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream line;
    line << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << ' ' << levelName(level)
         << " [" << component << "] " << message << '\n';
    const std::string s = line.str();

    std::lock_guard<std::mutex> lock(mutex());
    std::cerr << s << std::flush;
    auto& f = file();
    if (f.is_open()) {
        f << s;
        f.flush();
    }
}

} // namespace wakescribe
