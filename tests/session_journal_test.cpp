#include "session/session_journal.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace wakescribe;
using namespace wakescribe::test;

namespace {

SessionInfo info(std::uint64_t id, const std::string& keyword, int atMs) {
    return SessionInfo{id, DetectionEvent{keyword, 0.9f, wallOrigin() + std::chrono::milliseconds(atMs)}};
}

SessionSummary summary(const SessionInfo& i, FinalizeReason reason, SessionOutcome outcome,
                       const std::string& text, int atMs) {
    SessionSummary s;
    s.info = i;
    s.reason = reason;
    s.outcome = outcome;
    s.text = text;
    s.endedAt = wallOrigin() + std::chrono::milliseconds(atMs);
    return s;
}

} // namespace

TEST(SessionJournal, RecordsSessionLifecycle) {
    TempDir dir;
    SessionJournal journal(dir.str("db/sessions.db"));

    auto first = info(1, "hey computer", 1000);
    journal.onSessionStart(first);
    journal.onSessionEnd(summary(first, FinalizeReason::Silence, SessionOutcome::Transcribed,
                                 "turn on the lights", 5000));

    auto rows = journal.recent(10);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0].sessionId, 1);
    EXPECT_EQ(rows[0].startedMs, 1773489601000);
    EXPECT_EQ(rows[0].endedMs, 1773489605000);
    EXPECT_EQ(rows[0].keyword, "hey computer");
    EXPECT_NEAR(rows[0].confidence, 0.9, 1e-6);
    EXPECT_EQ(rows[0].reason, "silence");
    EXPECT_EQ(rows[0].outcome, "transcribed");
    EXPECT_EQ(rows[0].textChars, 18);
}

TEST(SessionJournal, NewestFirstAndOpenSessionsHaveNoOutcome) {
    TempDir dir;
    SessionJournal journal(dir.str("sessions.db"));

    auto a = info(1, "listen", 0);
    journal.onSessionStart(a);
    journal.onSessionEnd(summary(a, FinalizeReason::Stop, SessionOutcome::Empty, "", 100));
    journal.onSessionStart(info(2, "wake up", 200));

    auto rows = journal.recent(10);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].sessionId, 2);
    EXPECT_EQ(rows[0].outcome, "");
    EXPECT_EQ(rows[1].sessionId, 1);
    EXPECT_EQ(rows[1].reason, "stop");

    EXPECT_EQ(journal.recent(1).size(), 1u);
}

TEST(SessionJournal, NonPositiveLimitReturnsNothing) {
    TempDir dir;
    SessionJournal journal(dir.str("sessions.db"));
    journal.onSessionStart(info(1, "listen", 0));
    journal.onSessionStart(info(2, "wake up", 100));

    EXPECT_TRUE(journal.recent(0).empty());
    EXPECT_TRUE(journal.recent(-1).empty());
}

TEST(SessionJournal, HistorySurvivesRestartWithReusedIds) {
    TempDir dir;
    const std::string path = dir.str("sessions.db");
    {
        SessionJournal journal(path);
        auto s = info(1, "start", 0);
        journal.onSessionStart(s);
        journal.onSessionEnd(summary(s, FinalizeReason::Silence, SessionOutcome::Transcribed, "abc", 10));
    }

    SessionJournal journal(path);
    auto s = info(1, "listen", 1000);
    journal.onSessionStart(s);
    journal.onSessionEnd(summary(s, FinalizeReason::Pause, SessionOutcome::Empty, "", 1100));

    auto rows = journal.recent(10);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].keyword, "listen");
    EXPECT_EQ(rows[0].reason, "pause");
    // The earlier row with the same session id is left alone.
    EXPECT_EQ(rows[1].keyword, "start");
    EXPECT_EQ(rows[1].reason, "silence");
    EXPECT_EQ(rows[1].textChars, 3);
}
