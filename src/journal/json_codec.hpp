#pragma once

#include <vector>

#include "journal/journal_types.hpp"
#include "nlohmann/json.hpp"

namespace dailyfeels::journal {

nlohmann::json ToJson(const MoodDefinition& mood);
nlohmann::json ToJson(const MoodEntry& entry);
nlohmann::json ToJson(const std::vector<MoodDefinition>& moods);
nlohmann::json ToJson(const std::vector<MoodEntry>& entries);

// Boundary validation of request bodies. Both throw ValidationError.
MoodEntryInput ParseEntryInput(const nlohmann::json& body);
std::vector<MoodDefinition> ParseMoodConfig(const nlohmann::json& body);

// Field checks shared by the parser and EntryStore.
void ValidateEntryInput(const MoodEntryInput& input);

}  // namespace dailyfeels::journal
