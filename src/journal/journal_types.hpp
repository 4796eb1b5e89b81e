#pragma once

#include <optional>
#include <string>
#include <vector>

namespace dailyfeels::journal {

struct MoodDefinition {
    std::string value;
    std::string emoji;
    std::string label;
    std::optional<std::string> color;
};

// emoji is a denormalized copy taken at write time; it is allowed to drift
// from the active configuration.
struct MoodEntry {
    std::string id;
    std::string date;
    std::string mood_value;
    std::string emoji;
    std::optional<std::string> note;
    std::string created_at;
    std::string updated_at;
};

struct MoodEntryInput {
    std::string date;
    std::string mood_value;
    std::string emoji;
    std::optional<std::string> note;
};

struct DateRange {
    std::optional<std::string> start;
    std::optional<std::string> end;

    bool IsUnbounded() const { return !start.has_value() && !end.has_value(); }
};

}  // namespace dailyfeels::journal
