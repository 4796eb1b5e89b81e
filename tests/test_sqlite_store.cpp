#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "journal/errors.hpp"
#include "store/sqlite_store.hpp"

using dailyfeels::journal::MoodDefinition;
using dailyfeels::journal::MoodEntry;
using dailyfeels::store::SqliteStore;

namespace {

MoodEntry MakeEntry(const std::string& id, const std::string& date, const std::string& mood) {
    MoodEntry entry{};
    entry.id = id;
    entry.date = date;
    entry.mood_value = mood;
    entry.emoji = "\xF0\x9F\x98\x80";
    entry.created_at = "2024-01-01T08:00:00.000001Z";
    entry.updated_at = "2024-01-01T08:00:00.000001Z";
    return entry;
}

}  // namespace

class SqliteStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / "dailyfeels-store-test";
        std::filesystem::remove_all(testDir);
        std::filesystem::create_directories(testDir);
        dbPath = (testDir / "nested" / "journal.db").string();
    }

    void TearDown() override {
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
    std::string dbPath;
};

TEST_F(SqliteStoreTest, PersistsEntriesAcrossReopen) {
    {
        SqliteStore store(dbPath);
        auto entry = MakeEntry("id-1", "2024-01-01", "happy");
        entry.note = "caf\xC3\xA9 with friends";
        store.InsertEntry(entry);
    }
    SqliteStore reopened(dbPath);
    const auto found = reopened.FindEntryById("id-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->date, "2024-01-01");
    EXPECT_EQ(found->emoji, "\xF0\x9F\x98\x80");
    EXPECT_EQ(found->created_at, "2024-01-01T08:00:00.000001Z");
    ASSERT_TRUE(found->note.has_value());
    EXPECT_EQ(*found->note, "caf\xC3\xA9 with friends");
}

TEST_F(SqliteStoreTest, MissingNoteRoundTripsAsAbsent) {
    SqliteStore store(":memory:");
    store.InsertEntry(MakeEntry("id-1", "2024-01-01", "happy"));
    const auto found = store.FindEntryByDate("2024-01-01");
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->note.has_value());
}

TEST_F(SqliteStoreTest, ConflictingInsertKeepsFirstIdentity) {
    SqliteStore store(":memory:");
    store.InsertEntry(MakeEntry("first", "2024-01-01", "happy"));

    auto racing = MakeEntry("second", "2024-01-01", "sad");
    racing.created_at = "2024-01-01T09:00:00.000000Z";
    racing.updated_at = "2024-01-01T09:00:00.000000Z";
    const auto stored = store.InsertEntry(racing);

    EXPECT_EQ(stored.id, "first");
    EXPECT_EQ(stored.mood_value, "sad");
    EXPECT_EQ(stored.created_at, "2024-01-01T08:00:00.000001Z");
    EXPECT_EQ(stored.updated_at, "2024-01-01T09:00:00.000000Z");
    EXPECT_EQ(store.ListEntries({}).size(), 1u);
    EXPECT_FALSE(store.FindEntryById("second").has_value());
}

TEST_F(SqliteStoreTest, DeleteReportsWhetherRowExisted) {
    SqliteStore store(":memory:");
    store.InsertEntry(MakeEntry("id-1", "2024-01-01", "happy"));
    EXPECT_TRUE(store.DeleteEntry("id-1"));
    EXPECT_FALSE(store.DeleteEntry("id-1"));
}

TEST_F(SqliteStoreTest, UpdateReportsWhetherRowExisted) {
    SqliteStore store(":memory:");
    auto entry = MakeEntry("id-1", "2024-01-01", "happy");
    store.InsertEntry(entry);

    entry.mood_value = "sad";
    EXPECT_TRUE(store.UpdateEntry(entry));
    EXPECT_EQ(store.FindEntryById("id-1")->mood_value, "sad");

    store.DeleteEntry("id-1");
    EXPECT_FALSE(store.UpdateEntry(entry));
    EXPECT_TRUE(store.ListEntries({}).empty());
}

TEST_F(SqliteStoreTest, MoodConfigIsASingleReplaceableRecord) {
    SqliteStore store(":memory:");
    EXPECT_FALSE(store.LoadMoodConfig().has_value());

    store.ReplaceMoodConfig({{"calm", "~", "Calm", std::string("#123456")}}, "2024-01-01T00:00:00.000000Z");
    store.ReplaceMoodConfig({{"busy", "!", "Busy", std::nullopt}, {"calm", "~", "Calm", std::nullopt}},
                            "2024-01-02T00:00:00.000000Z");

    const auto loaded = store.LoadMoodConfig();
    ASSERT_TRUE(loaded.has_value());
    ASSERT_EQ(loaded->size(), 2u);
    EXPECT_EQ((*loaded)[0].value, "busy");
    EXPECT_FALSE((*loaded)[0].color.has_value());
    EXPECT_EQ((*loaded)[1].label, "Calm");
}

TEST_F(SqliteStoreTest, UnopenablePathThrowsPersistenceUnavailable) {
    const auto blocker = testDir / "not-a-directory";
    std::ofstream(blocker) << "x";
    const auto path = (blocker / "journal.db").string();
    EXPECT_THROW({ SqliteStore store(path); }, dailyfeels::journal::PersistenceUnavailable);
}
