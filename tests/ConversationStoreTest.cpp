#include <gtest/gtest.h>
#include <fstream>
#include <string>

#include "carydes/models/ConversationTurn.hpp"
#include "carydes/services/ConversationStore.hpp"
#include "carydes/services/TranscriptLogger.hpp"
#include "TestSupport.hpp"

using carydes::models::ConversationTurn;
using carydes::models::TurnRole;
using carydes::services::ConversationStore;
using carydes::services::TranscriptLogger;
using carydes::test::TempDir;
using carydes::test::read_lines;

TEST(ConversationStoreTest, UnknownUserHasEmptyHistory) {
    ConversationStore store;
    EXPECT_TRUE(store.snapshot(1).empty());
    EXPECT_EQ(store.size(1), 0u);
    store.clear(1);
    EXPECT_EQ(store.size(1), 0u);
}

TEST(ConversationStoreTest, KeepsMostRecentTurnsInOrder) {
    ConversationStore store(10);
    for (int i = 0; i < 11; ++i) {
        store.append(1, ConversationTurn::user(std::to_string(i)));
        EXPECT_LE(store.size(1), 10u);
    }

    auto turns = store.snapshot(1);
    ASSERT_EQ(turns.size(), 10u);
    for (size_t i = 0; i < turns.size(); ++i) {
        EXPECT_EQ(turns[i].content, std::to_string(i + 1));
    }
}

TEST(ConversationStoreTest, SnapshotIsACopy) {
    ConversationStore store;
    store.append(1, ConversationTurn::user("question"));
    auto before = store.snapshot(1);

    store.append(1, ConversationTurn::assistant("answer"));

    EXPECT_EQ(before.size(), 1u);
    auto after = store.snapshot(1);
    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(after[1].role, TurnRole::ASSISTANT);
}

TEST(ConversationStoreTest, UsersAreIsolated) {
    ConversationStore store;
    store.append(1, ConversationTurn::user("from one"));
    store.append(2, ConversationTurn::user("from two"));

    store.clear(1);

    EXPECT_EQ(store.size(1), 0u);
    ASSERT_EQ(store.size(2), 1u);
    EXPECT_EQ(store.snapshot(2)[0].content, "from two");
}

TEST(ConversationStoreTest, ZeroCapacityKeepsNothing) {
    ConversationStore store(0);
    store.append(1, ConversationTurn::user("dropped"));
    EXPECT_EQ(store.size(1), 0u);
}

TEST(ConversationStoreTest, ClearWithBoundaryLogsThenClears) {
    TempDir dir;
    const auto now = TranscriptLogger::Clock::now();
    TranscriptLogger logger(dir.path().string(), 8192, [now]() { return now; });
    ConversationStore store;
    store.append(5, ConversationTurn::user("old context"));

    EXPECT_TRUE(store.clear_with_boundary(5, logger));

    EXPECT_EQ(store.size(5), 0u);
    auto lines = read_lines(logger.file_for(5, now));
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("[system] --- NEW SESSION STARTED ---"), std::string::npos);
}

TEST(ConversationStoreTest, ClearWithBoundaryStillClearsWhenLoggingFails) {
    TempDir dir;
    const auto blocker = dir.path() / "file";
    std::ofstream(blocker) << "x";
    TranscriptLogger logger(blocker.string());
    ConversationStore store;
    store.append(5, ConversationTurn::user("old context"));

    EXPECT_FALSE(store.clear_with_boundary(5, logger));
    EXPECT_EQ(store.size(5), 0u);
}
