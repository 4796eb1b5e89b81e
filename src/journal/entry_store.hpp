#pragma once

#include <functional>
#include <string>
#include <vector>

#include "journal/journal_types.hpp"
#include "store/document_store.hpp"

namespace dailyfeels::journal {

// Keeps at most one entry per calendar date on top of a DocumentStore.
//
// Upsert reads then writes without a lock spanning both steps. Two concurrent
// upserts for the same date therefore race; the store resolves the collision
// as last write wins and the row keeps the id and created_at of whichever
// insert landed first.
class EntryStore {
public:
    using Clock = std::function<std::string()>;
    using IdGenerator = std::function<std::string()>;

    explicit EntryStore(store::DocumentStore& store,
                        Clock clock = {},
                        IdGenerator id_generator = {});

    MoodEntry Upsert(const MoodEntryInput& input);
    std::vector<MoodEntry> List(const DateRange& range = {});

    // Throws NotFoundError when no entry has this id.
    bool Delete(const std::string& id);

private:
    store::DocumentStore& store_;
    Clock clock_;
    IdGenerator id_generator_;
};

std::string GenerateEntryId();

}  // namespace dailyfeels::journal
