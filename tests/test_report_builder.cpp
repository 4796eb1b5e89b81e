#include <gtest/gtest.h>

#include <cstdio>
#include <iterator>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "journal/default_moods.hpp"
#include "report/report_builder.hpp"

using dailyfeels::journal::DateRange;
using dailyfeels::journal::MoodDefinition;
using dailyfeels::journal::MoodEntry;
using dailyfeels::report::ReportBuilder;

namespace {

MoodEntry Entry(const std::string& date, const std::string& mood,
                std::optional<std::string> note = std::nullopt) {
    MoodEntry entry{};
    entry.id = "id-" + date;
    entry.date = date;
    entry.mood_value = mood;
    entry.emoji = "e";
    entry.note = std::move(note);
    entry.created_at = "2024-01-01T00:00:00.000000Z";
    entry.updated_at = entry.created_at;
    return entry;
}

std::size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

// Page objects, not the /Pages tree node.
std::size_t CountPages(const std::string& pdf) {
    const std::regex page(R"(/Type\s*/Page\b)");
    return static_cast<std::size_t>(
        std::distance(std::sregex_iterator(pdf.begin(), pdf.end(), page), std::sregex_iterator()));
}

}  // namespace

class ReportBuilderTest : public ::testing::Test {
protected:
    ReportBuilder builder;
    const std::vector<MoodDefinition>& defaults = dailyfeels::journal::DefaultMoods();
};

TEST_F(ReportBuilderTest, SummarySortsByDescendingCount) {
    const std::vector<MoodEntry> entries = {
        Entry("2024-01-01", "happy"),
        Entry("2024-01-02", "happy"),
        Entry("2024-01-03", "sad"),
    };
    const auto report = builder.Build(entries, defaults, {});

    ASSERT_EQ(report.summary.size(), 2u);
    EXPECT_EQ(report.summary[0].label, "Happy");
    EXPECT_EQ(report.summary[0].count, 2);
    EXPECT_EQ(report.summary[1].label, "Sad");
    EXPECT_EQ(report.summary[1].count, 1);
}

TEST_F(ReportBuilderTest, SummaryTiesKeepFirstEncounteredOrder) {
    const std::vector<MoodEntry> entries = {
        Entry("2024-01-01", "tired"),
        Entry("2024-01-02", "angry"),
        Entry("2024-01-03", "content"),
        Entry("2024-01-04", "angry"),
        Entry("2024-01-05", "content"),
        Entry("2024-01-06", "tired"),
    };
    const auto report = builder.Build(entries, defaults, {});

    ASSERT_EQ(report.summary.size(), 3u);
    EXPECT_EQ(report.summary[0].label, "Tired");
    EXPECT_EQ(report.summary[1].label, "Angry");
    EXPECT_EQ(report.summary[2].label, "Content");
}

TEST_F(ReportBuilderTest, EmptyInputHasNoSummaryAndNoRows) {
    const auto report = builder.Build({}, defaults, {});
    EXPECT_EQ(report.title, "Mood Report");
    EXPECT_EQ(report.timeframe, "All time");
    EXPECT_TRUE(report.summary.empty());
    EXPECT_TRUE(report.entries.empty());

    const auto html = builder.RenderHtml(report);
    EXPECT_NE(html.find("Entries"), std::string::npos);
    EXPECT_NE(html.find("Mood Report"), std::string::npos);
    EXPECT_EQ(html.find("Summary"), std::string::npos);

    const auto pdf = builder.RenderPdf(report);
    EXPECT_EQ(pdf.rfind("%PDF-1.4", 0), 0u);
    EXPECT_EQ(CountPages(pdf), 1u);
}

TEST_F(ReportBuilderTest, UnknownMoodFallsBackToRawValueAndGrey) {
    const auto report = builder.Build({Entry("2024-01-01", "ecstatic")}, defaults, {});

    ASSERT_EQ(report.entries.size(), 1u);
    EXPECT_EQ(report.entries[0].label, "ecstatic");
    EXPECT_EQ(report.entries[0].color, "#999999");
    ASSERT_EQ(report.summary.size(), 1u);
    EXPECT_EQ(report.summary[0].label, "ecstatic");
}

TEST_F(ReportBuilderTest, DefinitionWithoutColorUsesFallbackColor) {
    const std::vector<MoodDefinition> moods = {
        {"calm", "~", "Calm", std::nullopt},
        {"busy", "!", "Busy", std::string()},
    };
    const auto report = builder.Build({Entry("2024-01-01", "calm"), Entry("2024-01-02", "busy")}, moods, {});
    EXPECT_EQ(report.entries[0].label, "Calm");
    EXPECT_EQ(report.entries[0].color, "#999999");
    EXPECT_EQ(report.entries[1].label, "Busy");
    EXPECT_EQ(report.entries[1].color, "#999999");
}

TEST_F(ReportBuilderTest, DetailRowsFollowInputOrderAndTruncateNotes) {
    const std::string long_note(250, 'n');
    const auto report = builder.Build(
        {Entry("2024-01-01", "happy", long_note), Entry("2024-01-02", "sad")}, defaults, {});

    ASSERT_EQ(report.entries.size(), 2u);
    EXPECT_EQ(report.entries[0].date, "2024-01-01");
    EXPECT_EQ(report.entries[0].color, "#22c55e");
    EXPECT_EQ(report.entries[0].note, std::string(200, 'n'));
    EXPECT_EQ(report.entries[1].note, "");
    EXPECT_EQ(report.entries[1].emoji, "e");
}

TEST_F(ReportBuilderTest, TruncationCountsCharactersNotBytes) {
    std::string note;
    for (int i = 0; i < 210; ++i) {
        note += "\xC3\xA9";
    }
    const auto report = builder.Build({Entry("2024-01-01", "happy", note)}, defaults, {});
    EXPECT_EQ(report.entries[0].note.size(), 400u);
}

TEST_F(ReportBuilderTest, TimeframeAndFilenameReflectBounds) {
    using dailyfeels::report::FormatTimeframe;
    using dailyfeels::report::ReportFilename;

    EXPECT_EQ(FormatTimeframe({}), "All time");
    EXPECT_EQ(FormatTimeframe({std::string("2024-01-01"), std::string("2024-01-31")}),
              "From 2024-01-01 to 2024-01-31");
    EXPECT_EQ(FormatTimeframe({std::string("2024-01-01"), std::nullopt}), "From 2024-01-01 to ...");
    EXPECT_EQ(FormatTimeframe({std::nullopt, std::string("2024-01-31")}), "From ... to 2024-01-31");

    EXPECT_EQ(ReportFilename({}), "mood_report_start_end.pdf");
    EXPECT_EQ(ReportFilename({std::string("2024-01-01"), std::nullopt}), "mood_report_2024-01-01_end.pdf");
    EXPECT_EQ(ReportFilename({std::string("2024-01-01"), std::string("2024-01-31")}),
              "mood_report_2024-01-01_2024-01-31.pdf");
}

TEST_F(ReportBuilderTest, ExportTableContentIsDeterministic) {
    const std::vector<MoodEntry> entries = {
        Entry("2024-01-01", "happy", std::string("a <b>tagged</b> & 50%1 note")),
        Entry("2024-01-02", "meh"),
    };
    const DateRange range{std::string("2024-01-01"), std::nullopt};

    const auto first = builder.RenderHtml(builder.Build(entries, defaults, range));
    const auto second = builder.RenderHtml(builder.Build(entries, defaults, range));
    EXPECT_EQ(first, second);
    EXPECT_NE(first.find("a &lt;b&gt;tagged&lt;/b&gt; &amp; 50%1 note"), std::string::npos);
    EXPECT_NE(first.find("From 2024-01-01 to ..."), std::string::npos);
    EXPECT_NE(first.find("color:#22c55e;"), std::string::npos);

    const auto artifact = builder.Export(entries, defaults, range);
    EXPECT_EQ(artifact.filename, "mood_report_2024-01-01_end.pdf");
    EXPECT_EQ(artifact.content_type, "application/pdf");
    EXPECT_EQ(artifact.content.rfind("%PDF-1.4", 0), 0u);
}

TEST_F(ReportBuilderTest, LongListsSpanSeveralPagesWithRepeatedHeader) {
    std::string note;
    for (int i = 0; i < 36; ++i) {
        note += "note ";
    }
    std::vector<MoodEntry> entries;
    for (int day = 1; day <= 28; ++day) {
        for (int month = 1; month <= 3; ++month) {
            char date[11];
            std::snprintf(date, sizeof(date), "2024-%02d-%02d", month, day);
            entries.push_back(Entry(date, "happy", note));
        }
    }
    const auto report = builder.Build(entries, defaults, {});

    const auto html = builder.RenderHtml(report);
    EXPECT_EQ(CountOccurrences(html, "<thead>"), 2u);
    EXPECT_GT(CountPages(builder.RenderPdf(report)), 2u);
}
