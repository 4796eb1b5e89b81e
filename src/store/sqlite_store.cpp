#include "store/sqlite_store.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "journal/errors.hpp"
#include "journal/json_codec.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace dailyfeels::store {
namespace {

constexpr const char* kMoodConfigKey = "mood_config";

constexpr const char* kEntryColumns =
    "id, date, mood_value, emoji, note, created_at, updated_at";

// Finalizes the prepared statement on every exit path.
class StatementGuard {
public:
    StatementGuard() = default;
    ~StatementGuard() {
        if (stmt_) {
            sqlite3_finalize(stmt_);
        }
    }
    StatementGuard(const StatementGuard&) = delete;
    StatementGuard& operator=(const StatementGuard&) = delete;

    sqlite3_stmt** Out() { return &stmt_; }
    sqlite3_stmt* Get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

void BindText(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value.has_value()) {
        BindText(stmt, index, *value);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::string ColumnText(sqlite3_stmt* stmt, int column) {
    const auto* text = sqlite3_column_text(stmt, column);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

// Column order follows kEntryColumns.
journal::MoodEntry ReadEntryRow(sqlite3_stmt* stmt) {
    journal::MoodEntry entry{};
    entry.id = ColumnText(stmt, 0);
    entry.date = ColumnText(stmt, 1);
    entry.mood_value = ColumnText(stmt, 2);
    entry.emoji = ColumnText(stmt, 3);
    if (sqlite3_column_type(stmt, 4) != SQLITE_NULL) {
        entry.note = ColumnText(stmt, 4);
    }
    entry.created_at = ColumnText(stmt, 5);
    entry.updated_at = ColumnText(stmt, 6);
    return entry;
}

}  // namespace

SqliteStore::SqliteStore(std::string db_path)
    : db_path_(std::move(db_path)) {
    if (db_path_ != ":memory:") {
        const auto parent = std::filesystem::path(db_path_).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }
    }
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(db_path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        utils::LogError("store", "failed to open sqlite db " + db_path_ + ": " + reason);
        throw journal::PersistenceUnavailable("cannot open database " + db_path_ + ": " + reason);
    }
    sqlite3_busy_timeout(db_, 2000);
    try {
        EnsureSchema();
    } catch (...) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
    utils::LogDebug("store", "opened sqlite db " + db_path_);
}

SqliteStore::~SqliteStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::optional<journal::MoodEntry> SqliteStore::FindEntryByDate(const std::string& date) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindEntryWhere("date", date);
}

std::optional<journal::MoodEntry> SqliteStore::FindEntryById(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return FindEntryWhere("id", id);
}

journal::MoodEntry SqliteStore::InsertEntry(const journal::MoodEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql =
        std::string("INSERT INTO mood_entries(") + kEntryColumns + ") VALUES(?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(date) DO UPDATE SET mood_value=excluded.mood_value, "
        "emoji=excluded.emoji, note=excluded.note, updated_at=excluded.updated_at;";
    {
        StatementGuard stmt;
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.Out(), nullptr) != SQLITE_OK) {
            Fail("prepare insert");
        }
        BindText(stmt.Get(), 1, entry.id);
        BindText(stmt.Get(), 2, entry.date);
        BindText(stmt.Get(), 3, entry.mood_value);
        BindText(stmt.Get(), 4, entry.emoji);
        BindOptionalText(stmt.Get(), 5, entry.note);
        BindText(stmt.Get(), 6, entry.created_at);
        BindText(stmt.Get(), 7, entry.updated_at);
        if (sqlite3_step(stmt.Get()) != SQLITE_DONE) {
            Fail("insert entry");
        }
    }
    auto stored = FindEntryWhere("date", entry.date);
    if (!stored.has_value()) {
        Fail("read back entry " + entry.date);
    }
    return *stored;
}

bool SqliteStore::UpdateEntry(const journal::MoodEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql =
        "UPDATE mood_entries SET mood_value = ?, emoji = ?, note = ?, updated_at = ? WHERE id = ?;";
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.Out(), nullptr) != SQLITE_OK) {
        Fail("prepare update");
    }
    BindText(stmt.Get(), 1, entry.mood_value);
    BindText(stmt.Get(), 2, entry.emoji);
    BindOptionalText(stmt.Get(), 3, entry.note);
    BindText(stmt.Get(), 4, entry.updated_at);
    BindText(stmt.Get(), 5, entry.id);
    if (sqlite3_step(stmt.Get()) != SQLITE_DONE) {
        Fail("update entry");
    }
    return sqlite3_changes(db_) > 0;
}

bool SqliteStore::DeleteEntry(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db_, "DELETE FROM mood_entries WHERE id = ?;", -1, stmt.Out(), nullptr) != SQLITE_OK) {
        Fail("prepare delete");
    }
    BindText(stmt.Get(), 1, id);
    if (sqlite3_step(stmt.Get()) != SQLITE_DONE) {
        Fail("delete entry");
    }
    return sqlite3_changes(db_) > 0;
}

std::vector<journal::MoodEntry> SqliteStore::ListEntries(const journal::DateRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string sql = std::string("SELECT ") + kEntryColumns + " FROM mood_entries";
    if (range.start && range.end) {
        sql += " WHERE date >= ? AND date <= ?";
    } else if (range.start) {
        sql += " WHERE date >= ?";
    } else if (range.end) {
        sql += " WHERE date <= ?";
    }
    sql += " ORDER BY date ASC;";

    StatementGuard stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.Out(), nullptr) != SQLITE_OK) {
        Fail("prepare list");
    }
    int index = 1;
    if (range.start) {
        BindText(stmt.Get(), index++, *range.start);
    }
    if (range.end) {
        BindText(stmt.Get(), index++, *range.end);
    }

    std::vector<journal::MoodEntry> entries;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.Get())) == SQLITE_ROW) {
        entries.push_back(ReadEntryRow(stmt.Get()));
    }
    if (rc != SQLITE_DONE) {
        Fail("list entries");
    }
    return entries;
}

std::optional<std::vector<journal::MoodDefinition>> SqliteStore::LoadMoodConfig() {
    std::lock_guard<std::mutex> lock(mutex_);
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db_, "SELECT value FROM settings WHERE key = ?;", -1, stmt.Out(), nullptr) != SQLITE_OK) {
        Fail("prepare settings lookup");
    }
    BindText(stmt.Get(), 1, kMoodConfigKey);
    const int rc = sqlite3_step(stmt.Get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        Fail("read settings");
    }
    const auto text = ColumnText(stmt.Get(), 0);
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (!parsed.is_array()) {
        utils::LogWarn("store", "stored mood config is not an array; ignoring it");
        return std::nullopt;
    }
    try {
        return journal::ParseMoodConfig(nlohmann::json{{"moods", parsed}});
    } catch (const journal::ValidationError& e) {
        utils::LogWarn("store", std::string("stored mood config is invalid; ignoring it: ") + e.what());
        return std::nullopt;
    }
}

void SqliteStore::ReplaceMoodConfig(const std::vector<journal::MoodDefinition>& moods,
                                    const std::string& updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string sql =
        "INSERT INTO settings(key, value, updated_at) VALUES(?, ?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at=excluded.updated_at;";
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.Out(), nullptr) != SQLITE_OK) {
        Fail("prepare settings replace");
    }
    BindText(stmt.Get(), 1, kMoodConfigKey);
    BindText(stmt.Get(), 2, journal::ToJson(moods).dump());
    BindText(stmt.Get(), 3, updated_at);
    if (sqlite3_step(stmt.Get()) != SQLITE_DONE) {
        Fail("replace settings");
    }
}

std::optional<journal::MoodEntry> SqliteStore::FindEntryWhere(const std::string& column,
                                                              const std::string& value) {
    const std::string sql =
        std::string("SELECT ") + kEntryColumns + " FROM mood_entries WHERE " + column + " = ?;";
    StatementGuard stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, stmt.Out(), nullptr) != SQLITE_OK) {
        Fail("prepare lookup by " + column);
    }
    BindText(stmt.Get(), 1, value);
    const int rc = sqlite3_step(stmt.Get());
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        Fail("lookup by " + column);
    }
    return ReadEntryRow(stmt.Get());
}

void SqliteStore::EnsureSchema() {
    Exec("PRAGMA journal_mode=WAL;");
    Exec("CREATE TABLE IF NOT EXISTS mood_entries ("
         "id TEXT PRIMARY KEY,"
         "date TEXT NOT NULL UNIQUE,"
         "mood_value TEXT NOT NULL,"
         "emoji TEXT NOT NULL,"
         "note TEXT,"
         "created_at TEXT NOT NULL,"
         "updated_at TEXT NOT NULL"
         ");");
    Exec("CREATE TABLE IF NOT EXISTS settings ("
         "key TEXT PRIMARY KEY,"
         "value TEXT NOT NULL,"
         "updated_at TEXT NOT NULL"
         ");");
}

void SqliteStore::Exec(const std::string& sql) {
    char* err = nullptr;
    const auto rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string reason = err ? err : sqlite3_errstr(rc);
        sqlite3_free(err);
        utils::LogError("store", "sqlite exec error: " + reason);
        throw journal::PersistenceUnavailable("sqlite exec failed: " + reason);
    }
}

void SqliteStore::Fail(const std::string& action) const {
    const std::string reason = sqlite3_errmsg(db_);
    utils::LogError("store", "failed to " + action + ": " + reason);
    throw journal::PersistenceUnavailable("failed to " + action + ": " + reason);
}

}  // namespace dailyfeels::store
