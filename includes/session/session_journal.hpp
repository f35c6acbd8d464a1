#pragma once
#include "session/notification.hpp"

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace wakescribe {

// History of wake sessions, fed as a notification sink.
// Schema:
//  - sessions(id INTEGER PK, session_id INTEGER, started_ms INTEGER, ended_ms INTEGER,
//             keyword TEXT, confidence REAL, reason TEXT, outcome TEXT, text_chars INTEGER)
//
// Times are wall-clock epoch millis. Events arrive on the hook dispatcher thread;
// queries may come from elsewhere, so access is serialized.
class SessionJournal : public NotificationSink {
public:
    struct Row {
        std::int64_t sessionId{0};
        std::int64_t startedMs{0};
        std::int64_t endedMs{0};
        std::string keyword;
        double confidence{0.0};
        std::string reason;
        std::string outcome;
        int textChars{0};
    };

    explicit SessionJournal(const std::string& db_path);
    ~SessionJournal() override;
    SessionJournal(const SessionJournal&) = delete;
    SessionJournal& operator=(const SessionJournal&) = delete;

    void onSessionStart(const SessionInfo& info) override;
    void onSessionEnd(const SessionSummary& summary) override;

    // Newest first.
    std::vector<Row> recent(int limit);

    const std::string& path() const { return db_path_; }

private:
    void init_schema();
    static std::int64_t to_ms(WallClock::time_point tp);

    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace wakescribe
