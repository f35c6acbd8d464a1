#include "session/session_journal.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace wakescribe {

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

// Finalizes a prepared statement on every path.
struct Statement {
    sqlite3_stmt* st = nullptr;
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("SQLite prepare failed: ") + sqlite3_errmsg(db));
        }
    }
    ~Statement() { sqlite3_finalize(st); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
};

SessionJournal::SessionJournal(const std::string& db_path) : db_path_(db_path) {
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Cannot open SQLite DB at " + db_path + ": " + msg);
    }
    init_schema();
}

SessionJournal::~SessionJournal() {
    if (db_) sqlite3_close(db_);
}

void SessionJournal::init_schema() {
    const char* schema = R"SQL(
    PRAGMA journal_mode=WAL;
    CREATE TABLE IF NOT EXISTS sessions (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        session_id INTEGER NOT NULL,
        started_ms INTEGER NOT NULL,
        ended_ms INTEGER,
        keyword TEXT NOT NULL,
        confidence REAL NOT NULL,
        reason TEXT,
        outcome TEXT,
        text_chars INTEGER DEFAULT 0
    );
    )SQL";
    exec_sql(db_, schema);
}

std::int64_t SessionJournal::to_ms(WallClock::time_point tp) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}

void SessionJournal::onSessionStart(const SessionInfo& info) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_, "INSERT INTO sessions (session_id, started_ms, keyword, confidence) VALUES (?, ?, ?, ?);");
    sqlite3_bind_int64(s.st, 1, static_cast<sqlite3_int64>(info.id));
    sqlite3_bind_int64(s.st, 2, to_ms(info.trigger.timestamp));
    sqlite3_bind_text(s.st, 3, info.trigger.keyword.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(s.st, 4, info.trigger.confidence);
    if (sqlite3_step(s.st) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to insert session: ") + sqlite3_errmsg(db_));
    }
}

void SessionJournal::onSessionEnd(const SessionSummary& summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    // Latest row for this session id: ids restart with each process.
    Statement s(db_, "UPDATE sessions SET ended_ms=?, reason=?, outcome=?, text_chars=? "
                     "WHERE id=(SELECT MAX(id) FROM sessions WHERE session_id=?);");
    sqlite3_bind_int64(s.st, 1, to_ms(summary.endedAt));
    sqlite3_bind_text(s.st, 2, toString(summary.reason), -1, SQLITE_STATIC);
    sqlite3_bind_text(s.st, 3, toString(summary.outcome), -1, SQLITE_STATIC);
    sqlite3_bind_int(s.st, 4, static_cast<int>(summary.text.size()));
    sqlite3_bind_int64(s.st, 5, static_cast<sqlite3_int64>(summary.info.id));
    if (sqlite3_step(s.st) != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to close session: ") + sqlite3_errmsg(db_));
    }
}

std::vector<SessionJournal::Row> SessionJournal::recent(int limit) {
    std::vector<Row> rows;
    // SQLite reads a negative LIMIT as no limit.
    if (limit <= 0) return rows;
    std::lock_guard<std::mutex> lock(mutex_);
    Statement s(db_, "SELECT session_id, started_ms, ended_ms, keyword, confidence, reason, outcome, text_chars "
                     "FROM sessions ORDER BY id DESC LIMIT ?;");
    sqlite3_bind_int(s.st, 1, limit);
    while (sqlite3_step(s.st) == SQLITE_ROW) {
        Row r;
        r.sessionId = sqlite3_column_int64(s.st, 0);
        r.startedMs = sqlite3_column_int64(s.st, 1);
        r.endedMs = sqlite3_column_int64(s.st, 2);
        auto text = [&](int col) {
            const unsigned char* v = sqlite3_column_text(s.st, col);
            return v ? std::string(reinterpret_cast<const char*>(v)) : std::string{};
        };
        r.keyword = text(3);
        r.confidence = sqlite3_column_double(s.st, 4);
        r.reason = text(5);
        r.outcome = text(6);
        r.textChars = sqlite3_column_int(s.st, 7);
        rows.push_back(std::move(r));
    }
    return rows;
}

} // namespace wakescribe
