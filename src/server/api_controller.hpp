#pragma once

#include <string>
#include <utility>
#include <vector>

#include "journal/entry_store.hpp"
#include "journal/journal_types.hpp"
#include "journal/mood_config_service.hpp"
#include "report/report_builder.hpp"

namespace dailyfeels::server {

struct ApiResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
    std::vector<std::pair<std::string, std::string>> headers;
};

// Maps API requests onto the journal core and core errors onto HTTP statuses:
// ValidationError -> 422, NotFoundError -> 404, PersistenceUnavailable -> 503.
class ApiController {
public:
    ApiController(journal::EntryStore& entries, journal::MoodConfigService& moods);

    ApiResponse Health() const;
    ApiResponse GetDefaultMoods() const;
    ApiResponse GetMoodConfig();
    ApiResponse SetMoodConfig(const std::string& body);
    ApiResponse CreateEntry(const std::string& body);
    ApiResponse ListEntries(const journal::DateRange& range);
    ApiResponse DeleteEntry(const std::string& id);
    ApiResponse ExportPdf(const journal::DateRange& range);

    // Query values are optional; an empty value counts as absent.
    static journal::DateRange MakeRange(const std::string& start, const std::string& end);

private:
    journal::EntryStore& entries_;
    journal::MoodConfigService& moods_;
    report::ReportBuilder reports_;
};

}  // namespace dailyfeels::server
