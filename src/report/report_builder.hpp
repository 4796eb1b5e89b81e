#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "journal/journal_types.hpp"

namespace dailyfeels::report {

constexpr const char* kFallbackColor = "#999999";
constexpr std::size_t kNoteCharacterLimit = 200;
constexpr const char* kPdfContentType = "application/pdf";

struct SummaryRow {
    std::string label;
    int count = 0;
};

struct DetailRow {
    std::string date;
    std::string label;
    std::string emoji;
    std::string note;
    std::string color;
};

// Table content of the report, independent of the output format. An empty
// summary means the summary section is omitted.
struct MoodReport {
    std::string title;
    std::string timeframe;
    std::vector<SummaryRow> summary;
    std::vector<DetailRow> entries;
};

struct ReportArtifact {
    std::string filename;
    std::string content_type;
    std::string content;
};

std::string FormatTimeframe(const journal::DateRange& range);
std::string ReportFilename(const journal::DateRange& range);

// Turns date-sorted entries and the active mood palette into a printable
// report. Never fails; an empty entry list gives a header-only document.
class ReportBuilder {
public:
    MoodReport Build(const std::vector<journal::MoodEntry>& entries,
                     const std::vector<journal::MoodDefinition>& moods,
                     const journal::DateRange& range) const;

    // Rich-text markup of the report; table headers repeat on every page.
    std::string RenderHtml(const MoodReport& report) const;
    // Requires a QGuiApplication in the process.
    std::string RenderPdf(const MoodReport& report) const;

    ReportArtifact Export(const std::vector<journal::MoodEntry>& entries,
                          const std::vector<journal::MoodDefinition>& moods,
                          const journal::DateRange& range) const;
};

}  // namespace dailyfeels::report
