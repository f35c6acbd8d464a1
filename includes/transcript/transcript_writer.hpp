#pragma once
#include "audio/audio_frame.hpp"

#include <cstddef>
#include <string>
#include <sys/types.h>

namespace wakescribe {

struct TranscriptEntry {
    WallClock::time_point timestamp;
    std::string text;
};

// Appends "[HH:MM:SS] <text>" lines to one file per local calendar date:
//   <outputDir>/transcript_YYYY-MM-DD.txt
// Every append is fsync'ed before it returns. Single writer: the audio loop.
class TranscriptWriter {
public:
    explicit TranscriptWriter(std::string outputDir);
    virtual ~TranscriptWriter();
    TranscriptWriter(const TranscriptWriter&) = delete;
    TranscriptWriter& operator=(const TranscriptWriter&) = delete;

    // Retries once after a failure, then logs and drops the entry.
    bool append(const TranscriptEntry& entry);

    // Close the cached handle; the next append reopens by path.
    void reopen();

    std::string pathFor(WallClock::time_point timestamp) const;
    const std::string& outputDir() const { return outputDir_; }

    // "[HH:MM:SS] text" in local time, CR/LF in text replaced by spaces.
    static std::string formatLine(const TranscriptEntry& entry);

protected:
    // Raw I/O, overridable to inject faults.
    virtual ssize_t writeBytes(int fd, const char* data, std::size_t size);
    virtual int syncFile(int fd);

private:
    // Resumes at `written`; throws WriteFailure.
    void writeOnce(const std::string& path, const std::string& line, std::size_t& written);
    void closeFile();

    std::string outputDir_;
    int fd_{-1};
    std::string currentPath_;
};

} // namespace wakescribe
