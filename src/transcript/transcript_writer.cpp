#include "transcript/transcript_writer.hpp"
#include "core/errors.hpp"
#include "core/log.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <unistd.h>

namespace wakescribe {

static std::tm localTime(WallClock::time_point tp) {
    std::time_t t = WallClock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

TranscriptWriter::TranscriptWriter(std::string outputDir) : outputDir_(std::move(outputDir)) {}

TranscriptWriter::~TranscriptWriter() {
    closeFile();
}

std::string TranscriptWriter::pathFor(WallClock::time_point timestamp) const {
    std::tm tm = localTime(timestamp);
    char name[64];
    std::strftime(name, sizeof(name), "transcript_%Y-%m-%d.txt", &tm);
    return (std::filesystem::path(outputDir_) / name).string();
}

std::string TranscriptWriter::formatLine(const TranscriptEntry& entry) {
    std::tm tm = localTime(entry.timestamp);
    char stamp[16];
    std::strftime(stamp, sizeof(stamp), "[%H:%M:%S] ", &tm);

    std::string line = stamp;
    for (char c : entry.text) line.push_back((c == '\n' || c == '\r') ? ' ' : c);
    line.push_back('\n');
    return line;
}

bool TranscriptWriter::append(const TranscriptEntry& entry) {
    // Date is checked on every call so a midnight rollover switches files.
    const std::string path = pathFor(entry.timestamp);
    const std::string line = formatLine(entry);

    // Bytes already on disk are not written again by the retry.
    std::size_t written = 0;
    for (int attempt = 1; attempt <= 2; ++attempt) {
        try {
            writeOnce(path, line, written);
            return true;
        } catch (const WriteFailure& e) {
            closeFile();
            if (attempt == 1) {
                Log::warn("Transcript", std::string(e.what()) + ", retrying");
            } else {
                Log::error("Transcript", std::string(e.what()) + ", entry dropped");
            }
        }
    }
    return false;
}

void TranscriptWriter::writeOnce(const std::string& path, const std::string& line, std::size_t& written) {
    if (fd_ < 0 || path != currentPath_) {
        closeFile();
        std::error_code ec;
        std::filesystem::create_directories(outputDir_, ec);
        if (ec) {
            throw WriteFailure("Cannot create " + outputDir_ + ": " + ec.message());
        }
        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw WriteFailure("Cannot open " + path + ": " + std::strerror(errno));
        }
        fd_ = fd;
        currentPath_ = path;
    }

    while (written < line.size()) {
        ssize_t n = writeBytes(fd_, line.data() + written, line.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw WriteFailure("Write to " + path + " failed: " + std::strerror(errno));
        }
        written += static_cast<std::size_t>(n);
    }
    if (syncFile(fd_) != 0) {
        throw WriteFailure("fsync of " + path + " failed: " + std::strerror(errno));
    }
}

ssize_t TranscriptWriter::writeBytes(int fd, const char* data, std::size_t size) {
    return ::write(fd, data, size);
}

int TranscriptWriter::syncFile(int fd) {
    return ::fsync(fd);
}

void TranscriptWriter::reopen() {
    closeFile();
}

void TranscriptWriter::closeFile() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    currentPath_.clear();
}

} // namespace wakescribe
