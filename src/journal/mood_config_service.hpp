#pragma once

#include <functional>
#include <string>
#include <vector>

#include "journal/journal_types.hpp"
#include "store/document_store.hpp"

namespace dailyfeels::journal {

// Read/replace access to the single process-wide mood palette. Readers racing
// a replace may see either the old or the new palette.
class MoodConfigService {
public:
    using Clock = std::function<std::string()>;

    explicit MoodConfigService(store::DocumentStore& store, Clock clock = {});

    std::vector<MoodDefinition> GetConfiguration();
    std::vector<MoodDefinition> SetConfiguration(const std::vector<MoodDefinition>& moods);

    static const std::vector<MoodDefinition>& Defaults();

private:
    store::DocumentStore& store_;
    Clock clock_;
};

}  // namespace dailyfeels::journal
