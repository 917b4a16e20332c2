#include <gtest/gtest.h>
#include "process/process_table.h"

#include <unistd.h>

using namespace kild;

namespace {

std::string stat_line(const std::string& pid, const std::string& comm) {
    // Fields 3..24 of proc(5): state ppid pgrp session tty tpgid flags minflt
    // cminflt majflt cmajflt utime stime cutime cstime priority nice threads
    // itrealvalue starttime vsize rss
    return pid + " (" + comm + ") S 1 100 100 0 -1 4194304 10 0 0 0 7 3 0 0 20 0 1 0 123456 1000 250";
}

}

TEST(ProcStatTest, ParsesPlainName) {
    auto entry = parse_proc_stat(stat_line("4242", "claude"));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->pid, 4242);
    EXPECT_EQ(entry->name, "claude");
    EXPECT_EQ(entry->state, 'S');
    EXPECT_EQ(entry->ppid, 1);
    EXPECT_EQ(entry->cpu_ticks, 10u);
    EXPECT_EQ(entry->start_time, 123456u);
    EXPECT_EQ(entry->rss_pages, 250u);
    EXPECT_FALSE(entry->is_zombie());
}

TEST(ProcStatTest, NameWithSpacesAndParens) {
    auto entry = parse_proc_stat(stat_line("77", "my (odd) name"));
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->name, "my (odd) name");
    EXPECT_EQ(entry->start_time, 123456u);
}

TEST(ProcStatTest, RejectsTruncatedContent) {
    EXPECT_FALSE(parse_proc_stat("12 (sh) S 1 2").has_value());
    EXPECT_FALSE(parse_proc_stat("garbage").has_value());
}

TEST(ProcStatTest, ZombieState) {
    std::string line = stat_line("9", "defunct");
    line.replace(line.find(") S") + 2, 1, "Z");
    auto entry = parse_proc_stat(line);
    ASSERT_TRUE(entry.has_value());
    EXPECT_TRUE(entry->is_zombie());
}

TEST(ProcfsProcessTableTest, FindsSelf) {
    ProcfsProcessTable table;
    auto entry = table.lookup(getpid());
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->pid, getpid());
    EXPECT_GT(entry->start_time, 0u);
    EXPECT_EQ(entry->uid, std::optional<uid_t>(geteuid()));
    EXPECT_FALSE(table.list().empty());
}

TEST(ProcfsProcessTableTest, MissingPid) {
    ProcfsProcessTable table;
    EXPECT_FALSE(table.lookup(0).has_value());
    EXPECT_FALSE(table.lookup(-5).has_value());
}
