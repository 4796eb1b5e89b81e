#include "report/report_builder.hpp"

#include <algorithm>
#include <mutex>
#include <unordered_map>
#include <utility>

#include <QBuffer>
#include <QByteArray>
#include <QFont>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPdfWriter>
#include <QString>
#include <QTextDocument>

#include "utils/common.hpp"

namespace dailyfeels::report {
namespace {

constexpr double kMarginPoints = 72.0;
constexpr const char* kHeaderBackground = "#f3f4f6";
constexpr const char* kGridColor = "#e5e7eb";

// Text layout goes through Qt's shared font cache.
std::mutex g_render_mutex;

QString Escaped(const std::string& text) {
    return QString::fromStdString(text).toHtmlEscaped();
}

QString HeaderRow(const std::vector<std::string>& headers, const std::vector<int>& widths) {
    QString html = QStringLiteral("<thead><tr>");
    for (std::size_t i = 0; i < headers.size(); ++i) {
        html += QStringLiteral("<th width=\"%1\" align=\"left\" bgcolor=\"%2\">%3</th>")
                    .arg(QString::number(widths[i]), QString::fromLatin1(kHeaderBackground), Escaped(headers[i]));
    }
    html += QStringLiteral("</tr></thead>");
    return html;
}

QString TableOpen() {
    return QStringLiteral("<table border=\"1\" cellspacing=\"0\" cellpadding=\"5\" "
                          "style=\"border-color:%1; border-style:solid;\">")
        .arg(QString::fromLatin1(kGridColor));
}

}  // namespace

std::string FormatTimeframe(const journal::DateRange& range) {
    if (range.IsUnbounded()) {
        return "All time";
    }
    return "From " + range.start.value_or("...") + " to " + range.end.value_or("...");
}

std::string ReportFilename(const journal::DateRange& range) {
    return "mood_report_" + range.start.value_or("start") + "_" + range.end.value_or("end") + ".pdf";
}

MoodReport ReportBuilder::Build(const std::vector<journal::MoodEntry>& entries,
                                const std::vector<journal::MoodDefinition>& moods,
                                const journal::DateRange& range) const {
    std::unordered_map<std::string, std::string> color_map;
    std::unordered_map<std::string, std::string> label_map;
    for (const auto& mood : moods) {
        color_map[mood.value] = mood.color && !mood.color->empty() ? *mood.color : std::string(kFallbackColor);
        label_map[mood.value] = mood.label;
    }
    auto label_for = [&label_map](const std::string& value) {
        auto it = label_map.find(value);
        return it != label_map.end() ? it->second : value;
    };
    auto color_for = [&color_map](const std::string& value) {
        auto it = color_map.find(value);
        return it != color_map.end() ? it->second : std::string(kFallbackColor);
    };

    MoodReport report{};
    report.title = "Mood Report";
    report.timeframe = FormatTimeframe(range);

    // Counts in first-encountered order so the stable sort keeps ties that way.
    std::vector<std::pair<std::string, int>> counts;
    std::unordered_map<std::string, std::size_t> positions;
    for (const auto& entry : entries) {
        auto it = positions.find(entry.mood_value);
        if (it == positions.end()) {
            positions.emplace(entry.mood_value, counts.size());
            counts.emplace_back(entry.mood_value, 1);
        } else {
            counts[it->second].second++;
        }
    }
    std::stable_sort(counts.begin(), counts.end(), [](const auto& a, const auto& b) {
        return a.second > b.second;
    });
    for (const auto& [value, count] : counts) {
        report.summary.push_back(SummaryRow{label_for(value), count});
    }

    for (const auto& entry : entries) {
        DetailRow row{};
        row.date = entry.date;
        row.label = label_for(entry.mood_value);
        row.emoji = entry.emoji;
        row.note = utils::TruncateUtf8(entry.note.value_or(""), kNoteCharacterLimit);
        row.color = color_for(entry.mood_value);
        report.entries.push_back(std::move(row));
    }
    return report;
}

std::string ReportBuilder::RenderHtml(const MoodReport& report) const {
    QString html = QStringLiteral("<html><body>");
    html += QStringLiteral("<h1 align=\"center\" style=\"font-size:18pt;\">%1</h1>").arg(Escaped(report.title));
    html += QStringLiteral("<p>%1</p>").arg(Escaped(report.timeframe));

    if (!report.summary.empty()) {
        const std::vector<int> widths = {200, 80};
        html += QStringLiteral("<h2 style=\"font-size:14pt;\">Summary</h2>");
        html += TableOpen() + HeaderRow({"Mood", "Count"}, widths) + QStringLiteral("<tbody>");
        for (const auto& row : report.summary) {
            html += QStringLiteral("<tr><td>%1</td><td>%2</td></tr>").arg(Escaped(row.label), QString::number(row.count));
        }
        html += QStringLiteral("</tbody></table>");
    }

    // Notes wrap inside their cell.
    const std::vector<int> widths = {80, 100, 44, 244};
    html += QStringLiteral("<h2 style=\"font-size:14pt;\">Entries</h2>");
    html += TableOpen() + HeaderRow({"Date", "Mood", "Emoji", "Note"}, widths) + QStringLiteral("<tbody>");
    for (const auto& row : report.entries) {
        html += QStringLiteral("<tr><td>%1</td><td><span style=\"color:%2;\">&#9632;</span> %3</td>"
                               "<td>%4</td><td>%5</td></tr>")
                    .arg(Escaped(row.date), Escaped(row.color), Escaped(row.label), Escaped(row.emoji),
                         Escaped(row.note));
    }
    html += QStringLiteral("</tbody></table></body></html>");
    return html.toStdString();
}

std::string ReportBuilder::RenderPdf(const MoodReport& report) const {
    std::lock_guard<std::mutex> lock(g_render_mutex);

    QTextDocument document;
    document.setDefaultFont(QFont(QStringLiteral("Helvetica"), 10));
    document.setDocumentMargin(0);
    document.setHtml(QString::fromStdString(RenderHtml(report)));

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);
    {
        QPdfWriter writer(&buffer);
        writer.setPdfVersion(QPagedPaintDevice::PdfVersion_1_4);
        writer.setTitle(QString::fromStdString(report.title));
        writer.setCreator(QStringLiteral("dailyfeels"));
        writer.setPageLayout(QPageLayout(QPageSize(QPageSize::Letter), QPageLayout::Portrait,
                                         QMarginsF(kMarginPoints, kMarginPoints, kMarginPoints, kMarginPoints),
                                         QPageLayout::Point));
        document.print(&writer);
    }
    buffer.close();
    return std::string(bytes.constData(), static_cast<std::size_t>(bytes.size()));
}

ReportArtifact ReportBuilder::Export(const std::vector<journal::MoodEntry>& entries,
                                     const std::vector<journal::MoodDefinition>& moods,
                                     const journal::DateRange& range) const {
    ReportArtifact artifact{};
    artifact.filename = ReportFilename(range);
    artifact.content_type = kPdfContentType;
    artifact.content = RenderPdf(Build(entries, moods, range));
    return artifact;
}

}  // namespace dailyfeels::report
