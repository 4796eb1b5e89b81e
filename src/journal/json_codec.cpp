#include "journal/json_codec.hpp"

#include <string>
#include <unordered_set>

#include "journal/errors.hpp"
#include "utils/common.hpp"

namespace dailyfeels::journal {
namespace {

// prefix is prepended to the field name in error messages, e.g. "moods[2]."
std::string RequireString(const nlohmann::json& body, const std::string& field,
                          const std::string& prefix = "") {
    if (!body.contains(field) || body[field].is_null()) {
        throw ValidationError(prefix + field, "field required");
    }
    if (!body[field].is_string()) {
        throw ValidationError(prefix + field, "must be a string");
    }
    return body[field].get<std::string>();
}

std::optional<std::string> OptionalString(const nlohmann::json& body, const std::string& field,
                                          const std::string& prefix = "") {
    if (!body.contains(field) || body[field].is_null()) {
        return std::nullopt;
    }
    if (!body[field].is_string()) {
        throw ValidationError(prefix + field, "must be a string or null");
    }
    return body[field].get<std::string>();
}

nlohmann::json OptionalToJson(const std::optional<std::string>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

}  // namespace

nlohmann::json ToJson(const MoodDefinition& mood) {
    return {
        {"value", mood.value},
        {"emoji", mood.emoji},
        {"label", mood.label},
        {"color", OptionalToJson(mood.color)}
    };
}

nlohmann::json ToJson(const MoodEntry& entry) {
    return {
        {"id", entry.id},
        {"date", entry.date},
        {"mood_value", entry.mood_value},
        {"emoji", entry.emoji},
        {"note", OptionalToJson(entry.note)},
        {"created_at", entry.created_at},
        {"updated_at", entry.updated_at}
    };
}

nlohmann::json ToJson(const std::vector<MoodDefinition>& moods) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& mood : moods) {
        json.push_back(ToJson(mood));
    }
    return json;
}

nlohmann::json ToJson(const std::vector<MoodEntry>& entries) {
    nlohmann::json json = nlohmann::json::array();
    for (const auto& entry : entries) {
        json.push_back(ToJson(entry));
    }
    return json;
}

MoodEntryInput ParseEntryInput(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ValidationError("body", "must be a JSON object");
    }
    MoodEntryInput input{};
    input.date = RequireString(body, "date");
    input.mood_value = RequireString(body, "mood_value");
    input.emoji = RequireString(body, "emoji");
    input.note = OptionalString(body, "note");
    ValidateEntryInput(input);
    return input;
}

std::vector<MoodDefinition> ParseMoodConfig(const nlohmann::json& body) {
    if (!body.is_object()) {
        throw ValidationError("body", "must be a JSON object");
    }
    if (!body.contains("moods") || !body["moods"].is_array()) {
        throw ValidationError("moods", "must be an array");
    }
    std::vector<MoodDefinition> moods;
    std::unordered_set<std::string> seen;
    const auto& items = body["moods"];
    for (std::size_t i = 0; i < items.size(); ++i) {
        const auto& item = items[i];
        const auto prefix = "moods[" + std::to_string(i) + "].";
        if (!item.is_object()) {
            throw ValidationError(prefix.substr(0, prefix.size() - 1), "must be an object");
        }
        MoodDefinition mood{};
        mood.value = RequireString(item, "value", prefix);
        mood.emoji = RequireString(item, "emoji", prefix);
        mood.label = RequireString(item, "label", prefix);
        mood.color = OptionalString(item, "color", prefix);
        if (!seen.insert(mood.value).second) {
            throw ValidationError(prefix + "value", "duplicate mood value '" + mood.value + "'");
        }
        moods.push_back(std::move(mood));
    }
    return moods;
}

void ValidateEntryInput(const MoodEntryInput& input) {
    if (!utils::IsValidIsoDate(input.date)) {
        throw ValidationError("date", "expected a calendar date as YYYY-MM-DD");
    }
    if (input.mood_value.empty()) {
        throw ValidationError("mood_value", "must not be empty");
    }
    if (input.emoji.empty()) {
        throw ValidationError("emoji", "must not be empty");
    }
}

}  // namespace dailyfeels::journal
