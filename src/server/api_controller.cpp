#include "server/api_controller.hpp"

#include "journal/errors.hpp"
#include "journal/json_codec.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace dailyfeels::server {
namespace {

ApiResponse JsonResponse(int status, const nlohmann::json& json) {
    ApiResponse response{};
    response.status = status;
    response.body = json.dump();
    return response;
}

ApiResponse ErrorResponse(int status, const std::string& detail) {
    return JsonResponse(status, nlohmann::json{{"detail", detail}});
}

nlohmann::json ParseBody(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    if (json.is_discarded()) {
        throw journal::ValidationError("body", "invalid JSON");
    }
    return json;
}

// Header quoted-string: backslash-escape quotes and backslashes, drop control bytes.
std::string QuoteHeaderValue(const std::string& value) {
    std::string quoted = "\"";
    for (const char c : value) {
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        } else if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
            continue;
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

template <typename Handler>
ApiResponse Guard(const char* operation, Handler&& handler) {
    try {
        return handler();
    } catch (const journal::ValidationError& e) {
        utils::LogInfo("http", std::string(operation) + " rejected: " + e.what());
        return ErrorResponse(422, e.what());
    } catch (const journal::NotFoundError& e) {
        return ErrorResponse(404, e.what());
    } catch (const journal::PersistenceUnavailable& e) {
        utils::LogError("http", std::string(operation) + " failed: " + e.what());
        return ErrorResponse(503, e.what());
    }
}

}  // namespace

ApiController::ApiController(journal::EntryStore& entries, journal::MoodConfigService& moods)
    : entries_(entries)
    , moods_(moods) {}

ApiResponse ApiController::Health() const {
    return JsonResponse(200, nlohmann::json{{"message", "Daily Feels API is running"}});
}

ApiResponse ApiController::GetDefaultMoods() const {
    return JsonResponse(200, journal::ToJson(journal::MoodConfigService::Defaults()));
}

ApiResponse ApiController::GetMoodConfig() {
    return Guard("get mood config", [this]() {
        return JsonResponse(200, nlohmann::json{{"moods", journal::ToJson(moods_.GetConfiguration())}});
    });
}

ApiResponse ApiController::SetMoodConfig(const std::string& body) {
    return Guard("set mood config", [this, &body]() {
        const auto moods = journal::ParseMoodConfig(ParseBody(body));
        return JsonResponse(200, nlohmann::json{{"moods", journal::ToJson(moods_.SetConfiguration(moods))}});
    });
}

ApiResponse ApiController::CreateEntry(const std::string& body) {
    return Guard("upsert entry", [this, &body]() {
        const auto input = journal::ParseEntryInput(ParseBody(body));
        return JsonResponse(200, journal::ToJson(entries_.Upsert(input)));
    });
}

ApiResponse ApiController::ListEntries(const journal::DateRange& range) {
    return Guard("list entries", [this, &range]() {
        return JsonResponse(200, journal::ToJson(entries_.List(range)));
    });
}

ApiResponse ApiController::DeleteEntry(const std::string& id) {
    return Guard("delete entry", [this, &id]() {
        entries_.Delete(id);
        return JsonResponse(200, nlohmann::json{{"ok", true}});
    });
}

ApiResponse ApiController::ExportPdf(const journal::DateRange& range) {
    return Guard("export pdf", [this, &range]() {
        const auto entries = entries_.List(range);
        const auto moods = moods_.GetConfiguration();
        auto artifact = reports_.Export(entries, moods, range);
        utils::LogInfo("report", "exported " + std::to_string(entries.size()) + " entries as " + artifact.filename);

        ApiResponse response{};
        response.status = 200;
        response.content_type = artifact.content_type;
        response.headers.emplace_back(
            "Content-Disposition", "attachment; filename=" + QuoteHeaderValue(artifact.filename));
        response.body = std::move(artifact.content);
        return response;
    });
}

journal::DateRange ApiController::MakeRange(const std::string& start, const std::string& end) {
    journal::DateRange range{};
    if (!start.empty()) {
        range.start = start;
    }
    if (!end.empty()) {
        range.end = end;
    }
    return range;
}

}  // namespace dailyfeels::server
