#pragma once

#include <mutex>
#include <string>

#include "sqlite3.h"
#include "store/document_store.hpp"

namespace dailyfeels::store {

// DocumentStore over a single SQLite database file. ":memory:" gives a private
// in-memory database, which the tests use.
class SqliteStore : public DocumentStore {
public:
    explicit SqliteStore(std::string db_path);
    ~SqliteStore() override;

    SqliteStore(const SqliteStore&) = delete;
    SqliteStore& operator=(const SqliteStore&) = delete;

    std::optional<journal::MoodEntry> FindEntryByDate(const std::string& date) override;
    std::optional<journal::MoodEntry> FindEntryById(const std::string& id) override;
    journal::MoodEntry InsertEntry(const journal::MoodEntry& entry) override;
    bool UpdateEntry(const journal::MoodEntry& entry) override;
    bool DeleteEntry(const std::string& id) override;
    std::vector<journal::MoodEntry> ListEntries(const journal::DateRange& range) override;

    std::optional<std::vector<journal::MoodDefinition>> LoadMoodConfig() override;
    void ReplaceMoodConfig(const std::vector<journal::MoodDefinition>& moods,
                           const std::string& updated_at) override;

    const std::string& Path() const { return db_path_; }

private:
    void EnsureSchema();
    void Exec(const std::string& sql);
    std::optional<journal::MoodEntry> FindEntryWhere(const std::string& column, const std::string& value);
    [[noreturn]] void Fail(const std::string& action) const;

    std::string db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace dailyfeels::store
