#include <gtest/gtest.h>
#include "sessions/session_store.h"
#include "test_support.h"

using namespace kild;

namespace {

Session make_session(const std::string& project, const std::string& branch, int64_t created_at) {
    Session session;
    session.project_id = project;
    session.branch = branch;
    session.id = make_session_id(project, branch);
    session.port_range = {3000, 10};
    session.created_at = created_at;
    session.updated_at = created_at;
    return session;
}

}

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store_ = std::make_unique<SessionStore>(dir_.path() / "sessions");
    }

    test::TempDir dir_;
    std::unique_ptr<SessionStore> store_;
};

TEST_F(SessionStoreTest, SaveAndLoad) {
    Session session = make_session("proj", "feature/login", 10);
    session.process = ProcessHandle{1234, "claude", 5555};

    ASSERT_TRUE(store_->save(session).ok());

    auto loaded = store_->load(session.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->branch, "feature/login");
    ASSERT_TRUE(loaded->process.has_value());
    EXPECT_EQ(loaded->process->pid, 1234);
}

TEST_F(SessionStoreTest, LoadMissingReturnsNothing) {
    EXPECT_FALSE(store_->load("proj/missing").has_value());
}

TEST_F(SessionStoreTest, SaveRequiresId) {
    Session session;
    auto status = store_->save(session);
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::InvalidInput);
}

TEST_F(SessionStoreTest, ListFiltersByProjectAndSortsByCreation) {
    ASSERT_TRUE(store_->save(make_session("a", "two", 20)).ok());
    ASSERT_TRUE(store_->save(make_session("a", "one", 10)).ok());
    ASSERT_TRUE(store_->save(make_session("b", "other", 5)).ok());

    auto sessions = store_->list("a");
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].branch, "one");
    EXPECT_EQ(sessions[1].branch, "two");
    EXPECT_EQ(store_->list_all().size(), 3u);
}

TEST_F(SessionStoreTest, OverwriteKeepsSingleRecord) {
    Session session = make_session("a", "b", 1);
    ASSERT_TRUE(store_->save(session).ok());
    session.note = "updated";
    ASSERT_TRUE(store_->save(session).ok());

    auto sessions = store_->list_all();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].note, "updated");
}

TEST_F(SessionStoreTest, InterruptedWriteLeavesRecordIntact) {
    Session session = make_session("a", "b", 1);
    session.note = "original";
    ASSERT_TRUE(store_->save(session).ok());

    // A crash between write and rename leaves only a temp sibling behind.
    auto record = store_->path_for(session.id);
    test::write_text(record.string() + ".tmp.99999.0", "{\"id\": \"a/b\", \"note\": \"half");

    auto loaded = store_->load(session.id);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->note, "original");
    EXPECT_EQ(store_->list_all().size(), 1u);
}

TEST_F(SessionStoreTest, CorruptRecordIsSkipped) {
    ASSERT_TRUE(store_->save(make_session("a", "good", 1)).ok());
    test::write_text(store_->dir() / "broken.json", "not json");

    auto sessions = store_->list_all();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].branch, "good");
}

TEST_F(SessionStoreTest, RemoveIsIdempotent) {
    Session session = make_session("a", "b", 1);
    ASSERT_TRUE(store_->save(session).ok());

    EXPECT_TRUE(store_->remove(session.id).ok());
    EXPECT_FALSE(store_->load(session.id).has_value());
    EXPECT_TRUE(store_->remove(session.id).ok());
}

TEST_F(SessionStoreTest, LoadRejectsSanitizedIdCollision) {
    ASSERT_TRUE(store_->save(make_session("a", "x:y", 1)).ok());
    // "a/x:y" and "a/x_y" share a file name once sanitized.
    EXPECT_FALSE(store_->load("a/x_y").has_value());
    EXPECT_TRUE(store_->load("a/x:y").has_value());
}
