#include <gtest/gtest.h>
#include "process/process_tracker.h"

#include <map>
#include <sys/wait.h>

using namespace kild;

namespace {

// Process table whose contents the test controls. A process listed under
// `appears_after` becomes visible once list() has been called that many times.
class FakeProcessTable : public ProcessTable {
public:
    std::optional<ProcessEntry> lookup(pid_t pid) const override {
        auto it = entries.find(pid);
        if (it == entries.end()) return std::nullopt;
        return it->second;
    }

    std::vector<ProcessEntry> list() const override {
        ++list_calls;
        std::vector<ProcessEntry> result;
        for (const auto& [pid, entry] : entries) {
            result.push_back(entry);
        }
        if (late_entry && list_calls >= appears_after) {
            result.push_back(*late_entry);
        }
        return result;
    }

    std::optional<ProcessMetrics> metrics(pid_t) const override {
        return std::nullopt;
    }

    std::map<pid_t, ProcessEntry> entries;
    std::optional<ProcessEntry> late_entry;
    int appears_after = 0;
    mutable int list_calls = 0;
};

ProcessEntry make_entry(pid_t pid, const std::string& name, uint64_t start_time, char state = 'S',
                        uid_t uid = 1000) {
    ProcessEntry entry;
    entry.pid = pid;
    entry.name = name;
    entry.start_time = start_time;
    entry.state = state;
    entry.uid = uid;
    return entry;
}

}

TEST(MatchPatternsTest, IncludesDashPrefixAndExtras) {
    auto patterns = build_match_patterns("/usr/local/bin/kiro-cli", {"kiro", "kiro-cli-chat"});
    ASSERT_EQ(patterns.size(), 3u);
    EXPECT_EQ(patterns[0], "kiro-cli");
    EXPECT_EQ(patterns[1], "kiro");
    EXPECT_EQ(patterns[2], "kiro-cli-chat");
}

TEST(MatchPatternsTest, NameMatching) {
    EXPECT_TRUE(process_name_matches("Claude", "claude"));
    EXPECT_TRUE(process_name_matches("node-claude", "claude"));
    EXPECT_FALSE(process_name_matches("bash", "claude"));
    EXPECT_FALSE(process_name_matches("", "claude"));
    // comm is truncated to 15 bytes.
    EXPECT_TRUE(process_name_matches("averyveryverylo", "averyveryverylongname"));
}

TEST(MatchPatternsTest, ShortPatternsMatchWholeName) {
    EXPECT_TRUE(process_name_matches("sh", "sh"));
    EXPECT_TRUE(process_name_matches("AMP", "amp"));
    EXPECT_FALSE(process_name_matches("bash", "sh"));
    EXPECT_FALSE(process_name_matches("ssh", "sh"));
    EXPECT_FALSE(process_name_matches("zsh", "sh"));
    EXPECT_FALSE(process_name_matches("ampd", "amp"));
}

TEST(ProcessTrackerTest, LivenessChecksIdentity) {
    auto table = std::make_shared<FakeProcessTable>();
    table->entries[100] = make_entry(100, "claude", 5000);
    table->entries[200] = make_entry(200, "claude", 6000, 'Z');
    ProcessTracker tracker(table);

    EXPECT_EQ(tracker.liveness({100, "claude", 5000}), Liveness::Running);
    EXPECT_EQ(tracker.liveness({100, "claude", 5001}), Liveness::NotRunning);
    EXPECT_EQ(tracker.liveness({100, "codex", 5000}), Liveness::NotRunning);
    EXPECT_EQ(tracker.liveness({100, "claude", 0}), Liveness::Unknown);
    EXPECT_EQ(tracker.liveness({200, "claude", 6000}), Liveness::NotRunning);
    EXPECT_EQ(tracker.liveness({300, "claude", 1}), Liveness::NotRunning);
}

TEST(ProcessTrackerTest, FindWithRetryFindsLateProcess) {
    auto table = std::make_shared<FakeProcessTable>();
    table->late_entry = make_entry(321, "kiro-cli", 900);
    table->appears_after = 3;

    std::vector<std::chrono::milliseconds> sleeps;
    ProcessTracker tracker(table, [&sleeps](std::chrono::milliseconds d) { sleeps.push_back(d); });

    auto handle = tracker.find_by_name_with_retry("kiro-cli", {}, 5, std::chrono::milliseconds(10));
    ASSERT_TRUE(handle.ok()) << handle.error().describe();
    EXPECT_EQ(handle->pid, 321);
    EXPECT_EQ(handle->start_time, 900u);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], std::chrono::milliseconds(10));
    EXPECT_EQ(sleeps[1], std::chrono::milliseconds(20));
}

TEST(ProcessTrackerTest, FindWithRetryPrefersNewestMatch) {
    auto table = std::make_shared<FakeProcessTable>();
    table->entries[10] = make_entry(10, "claude", 100);
    table->entries[11] = make_entry(11, "claude", 300);
    table->entries[12] = make_entry(12, "claude", 200);
    ProcessTracker tracker(table, [](std::chrono::milliseconds) {});

    auto handle = tracker.find_by_name_with_retry("claude", {}, 1, std::chrono::milliseconds(1));
    ASSERT_TRUE(handle.ok());
    EXPECT_EQ(handle->pid, 11);
}

TEST(ProcessTrackerTest, FindWithRetrySkipsOtherUsersAndOlderProcesses) {
    auto table = std::make_shared<FakeProcessTable>();
    // Another user's agent, started later than ours.
    table->entries[10] = make_entry(10, "claude", 900, 'S', 0);
    // Same user, but already running before the terminal was launched.
    table->entries[11] = make_entry(11, "claude", 100);
    table->entries[12] = make_entry(12, "claude", 500);
    ProcessTracker tracker(table, [](std::chrono::milliseconds) {});

    MatchFilter filter;
    filter.uid = 1000;
    filter.started_at_or_after = 400;
    auto handle = tracker.find_by_name_with_retry("claude", {}, 1, std::chrono::milliseconds(1), filter);
    ASSERT_TRUE(handle.ok()) << handle.error().describe();
    EXPECT_EQ(handle->pid, 12);

    table->entries.erase(12);
    auto none = tracker.find_by_name_with_retry("claude", {}, 1, std::chrono::milliseconds(1), filter);
    ASSERT_FALSE(none.ok());
    EXPECT_EQ(none.error().kind, ErrorKind::NotFound);
}

TEST(ProcessTrackerTest, FindWithRetryGivesUp) {
    auto table = std::make_shared<FakeProcessTable>();
    table->entries[10] = make_entry(10, "bash", 100);
    int sleeps = 0;
    ProcessTracker tracker(table, [&sleeps](std::chrono::milliseconds) { ++sleeps; });

    auto handle = tracker.find_by_name_with_retry("claude", {}, 4, std::chrono::milliseconds(1));
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(sleeps, 3);
    EXPECT_EQ(table->list_calls, 4);
}

TEST(ProcessTrackerTest, KillAlreadyExitedSucceeds) {
    auto table = std::make_shared<FakeProcessTable>();
    ProcessTracker tracker(table);
    EXPECT_TRUE(tracker.kill({999999, "ghost", 1}).ok());
}

TEST(ProcessTrackerTest, SpawnAndKillRealProcess) {
    ProcessTracker tracker;
    auto handle = tracker.spawn_and_track("sleep 30", "/tmp");
    ASSERT_TRUE(handle.ok()) << handle.error().describe();
    EXPECT_EQ(handle->process_name, "sleep");
    EXPECT_GT(handle->start_time, 0u);
    EXPECT_TRUE(tracker.is_running(*handle));

    auto status = tracker.kill(*handle, std::chrono::milliseconds(1000));
    ASSERT_TRUE(status.ok()) << status.error().describe();
    EXPECT_FALSE(tracker.is_running(*handle));
}

TEST(ProcessTrackerTest, ReusedPidIsNotSignalled) {
    ProcessTracker tracker;
    auto handle = tracker.spawn_and_track("sleep 30", "/tmp");
    ASSERT_TRUE(handle.ok()) << handle.error().describe();

    ProcessHandle stale = *handle;
    stale.start_time += 1;

    auto status = tracker.kill(stale, std::chrono::milliseconds(200));
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::IdentityMismatch);
    EXPECT_TRUE(tracker.is_running(*handle));

    ASSERT_TRUE(tracker.kill(*handle, std::chrono::milliseconds(1000)).ok());
}

TEST(ProcessTrackerTest, SpawnMissingProgramFails) {
    ProcessTracker tracker;
    auto handle = tracker.spawn_and_track("kild-definitely-not-a-program", "/tmp");
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().kind, ErrorKind::IoFailure);
}

TEST(ProcessTrackerTest, SpawnEmptyCommandIsInvalid) {
    ProcessTracker tracker;
    auto handle = tracker.spawn_and_track("   ", "/tmp");
    ASSERT_FALSE(handle.ok());
    EXPECT_EQ(handle.error().kind, ErrorKind::InvalidInput);
}
