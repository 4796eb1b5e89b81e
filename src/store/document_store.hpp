#pragma once

#include <optional>
#include <string>
#include <vector>

#include "journal/journal_types.hpp"

namespace dailyfeels::store {

// Persistence collaborator for the journal core. Every method either completes
// as one step or throws journal::PersistenceUnavailable.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    virtual std::optional<journal::MoodEntry> FindEntryByDate(const std::string& date) = 0;
    virtual std::optional<journal::MoodEntry> FindEntryById(const std::string& id) = 0;

    // Inserts a new entry. If another writer created an entry for the same date
    // in the meantime, that row keeps its id and created_at and takes the new
    // mood fields (last write wins). Returns the row as stored.
    virtual journal::MoodEntry InsertEntry(const journal::MoodEntry& entry) = 0;
    // Returns false when no row with entry.id exists any more.
    virtual bool UpdateEntry(const journal::MoodEntry& entry) = 0;
    virtual bool DeleteEntry(const std::string& id) = 0;

    // Inclusive on both bounds, ascending by date.
    virtual std::vector<journal::MoodEntry> ListEntries(const journal::DateRange& range) = 0;

    virtual std::optional<std::vector<journal::MoodDefinition>> LoadMoodConfig() = 0;
    virtual void ReplaceMoodConfig(const std::vector<journal::MoodDefinition>& moods,
                                   const std::string& updated_at) = 0;
};

}  // namespace dailyfeels::store
