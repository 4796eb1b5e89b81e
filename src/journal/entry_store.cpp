#include "journal/entry_store.hpp"

#include <utility>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "journal/errors.hpp"
#include "journal/json_codec.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace dailyfeels::journal {

std::string GenerateEntryId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

EntryStore::EntryStore(store::DocumentStore& store, Clock clock, IdGenerator id_generator)
    : store_(store)
    , clock_(clock ? std::move(clock) : Clock(utils::NowIsoUtc))
    , id_generator_(id_generator ? std::move(id_generator) : IdGenerator(GenerateEntryId)) {}

MoodEntry EntryStore::Upsert(const MoodEntryInput& input) {
    ValidateEntryInput(input);
    const auto now = clock_();

    auto existing = store_.FindEntryByDate(input.date);
    if (existing.has_value()) {
        existing->mood_value = input.mood_value;
        existing->emoji = input.emoji;
        existing->note = input.note;
        existing->updated_at = now;
        if (store_.UpdateEntry(*existing)) {
            utils::LogDebug("entries", "updated entry " + existing->id + " for " + input.date);
            return *existing;
        }
        // Deleted after the lookup; store it as a new entry instead.
        utils::LogDebug("entries", "entry " + existing->id + " vanished before update");
    }

    MoodEntry entry{};
    entry.id = id_generator_();
    entry.date = input.date;
    entry.mood_value = input.mood_value;
    entry.emoji = input.emoji;
    entry.note = input.note;
    entry.created_at = now;
    entry.updated_at = now;
    auto stored = store_.InsertEntry(entry);
    utils::LogDebug("entries", "created entry " + stored.id + " for " + input.date);
    return stored;
}

std::vector<MoodEntry> EntryStore::List(const DateRange& range) {
    return store_.ListEntries(range);
}

bool EntryStore::Delete(const std::string& id) {
    if (!store_.DeleteEntry(id)) {
        throw NotFoundError("Entry not found");
    }
    utils::LogDebug("entries", "deleted entry " + id);
    return true;
}

}  // namespace dailyfeels::journal
