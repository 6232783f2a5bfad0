/**
 * @file ReferenceExportService.cpp
 * @brief Implementation of ReferenceExportService.
 */

#include "application/ReferenceExportService.hpp"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <map>
#include <sstream>

namespace citewalker::application {

using namespace citewalker::domain::references;

namespace {

const std::vector<std::string> kCsvColumns = {
    "sequence_number", "full_text", "authors", "title", "year", "venue",
    "volume", "issue", "pages", "doi", "url", "isbn", "reference_type",
    "citation_style", "confidence_score", "match_confidence", "provenance", "notes"
};

std::string FormatScore(float score) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << score;
    return oss.str();
}

std::string OptionalToString(const std::optional<int>& value) {
    return value ? std::to_string(*value) : std::string();
}

std::string CsvEscape(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) return value;
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += "\"\"";
        else out += c;
    }
    out += "\"";
    return out;
}

// Keeps table cells on one row.
std::string MarkdownCell(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '|') out += "\\|";
        else if (c == '\n' || c == '\r') out += ' ';
        else out += c;
    }
    return out;
}

float AverageConfidence(const std::vector<ExtractedReference>& references) {
    if (references.empty()) return 0.0f;
    float sum = 0.0f;
    for (const auto& ref : references) sum += ref.confidenceScore;
    return sum / static_cast<float>(references.size());
}

std::string Capitalize(std::string value) {
    if (!value.empty()) value[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(value[0])));
    return value;
}

std::vector<std::pair<std::string, std::string>> PresentFields(const ExtractedReference& ref) {
    std::vector<std::pair<std::string, std::string>> fields;
    if (!ref.authors.empty()) fields.emplace_back("Authors", ReferenceExportService::JoinAuthors(ref.authors));
    if (!ref.title.empty()) fields.emplace_back("Title", ref.title);
    if (ref.year) fields.emplace_back("Year", std::to_string(*ref.year));
    if (!ref.venue.empty()) fields.emplace_back("Venue", ref.venue);
    if (!ref.volume.empty()) fields.emplace_back("Volume", ref.volume);
    if (!ref.issue.empty()) fields.emplace_back("Issue", ref.issue);
    if (!ref.pages.empty()) fields.emplace_back("Pages", ref.pages);
    if (!ref.doi.empty()) fields.emplace_back("DOI", ref.doi);
    if (!ref.url.empty()) fields.emplace_back("URL", ref.url);
    if (!ref.isbn.empty()) fields.emplace_back("ISBN", ref.isbn);
    fields.emplace_back("Type", ReferenceTypeToString(ref.referenceType));
    fields.emplace_back("Citation Style", CitationStyleToString(ref.citationStyle));
    fields.emplace_back("Confidence Score", FormatScore(ref.confidenceScore));
    if (!ref.notes.empty()) fields.emplace_back("Notes", ref.notes);
    return fields;
}

} // namespace

const std::vector<std::string>& ReferenceExportService::SupportedFormats() {
    static const std::vector<std::string> formats = {"json", "csv", "txt", "md"};
    return formats;
}

std::optional<std::string> ReferenceExportService::Render(const std::string& format,
                                                          const std::vector<ExtractedReference>& references,
                                                          const std::string& timestamp) {
    if (format == "json") return ToJson(references, timestamp);
    if (format == "csv") return ToCsv(references);
    if (format == "txt") return ToText(references, timestamp);
    if (format == "md") return ToMarkdown(references, timestamp);
    return std::nullopt;
}

std::string ReferenceExportService::JoinAuthors(const std::vector<std::string>& authors) {
    std::string joined;
    for (size_t i = 0; i < authors.size(); ++i) {
        if (i > 0) joined += "; ";
        joined += authors[i];
    }
    return joined;
}

nlohmann::json ReferenceExportService::ToJsonRecord(const ExtractedReference& ref) {
    nlohmann::json j;
    j["sequence_number"] = ref.sequenceNumber ? nlohmann::json(*ref.sequenceNumber) : nlohmann::json("");
    j["full_text"] = ref.fullText;
    j["authors"] = ref.authors;
    j["title"] = ref.title;
    j["year"] = ref.year ? nlohmann::json(*ref.year) : nlohmann::json("");
    j["venue"] = ref.venue;
    j["volume"] = ref.volume;
    j["issue"] = ref.issue;
    j["pages"] = ref.pages;
    j["doi"] = ref.doi;
    j["url"] = ref.url;
    j["isbn"] = ref.isbn;
    j["reference_type"] = ReferenceTypeToString(ref.referenceType);
    j["citation_style"] = CitationStyleToString(ref.citationStyle);
    j["confidence_score"] = ref.confidenceScore;
    j["match_confidence"] = ref.matchConfidence;
    j["provenance"] = StrategyToString(ref.provenance);
    j["notes"] = ref.notes;
    return j;
}

std::string ReferenceExportService::ToJson(const std::vector<ExtractedReference>& references,
                                           const std::string& timestamp) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& ref : references) {
        records.push_back(ToJsonRecord(ref));
    }

    nlohmann::json payload = {
        {"extraction_metadata", {
            {"total_references", references.size()},
            {"extraction_timestamp", timestamp},
            {"format_version", "1.0"}
        }},
        {"references", records}
    };
    return payload.dump(2);
}

std::string ReferenceExportService::ToCsv(const std::vector<ExtractedReference>& references) {
    std::ostringstream ss;
    for (size_t i = 0; i < kCsvColumns.size(); ++i) {
        if (i > 0) ss << ",";
        ss << kCsvColumns[i];
    }
    ss << "\r\n";

    for (const auto& ref : references) {
        const std::vector<std::string> row = {
            OptionalToString(ref.sequenceNumber),
            ref.fullText,
            JoinAuthors(ref.authors),
            ref.title,
            OptionalToString(ref.year),
            ref.venue,
            ref.volume,
            ref.issue,
            ref.pages,
            ref.doi,
            ref.url,
            ref.isbn,
            ReferenceTypeToString(ref.referenceType),
            CitationStyleToString(ref.citationStyle),
            FormatScore(ref.confidenceScore),
            FormatScore(ref.matchConfidence),
            StrategyToString(ref.provenance),
            ref.notes
        };
        for (size_t i = 0; i < row.size(); ++i) {
            if (i > 0) ss << ",";
            ss << CsvEscape(row[i]);
        }
        ss << "\r\n";
    }
    return ss.str();
}

std::string ReferenceExportService::ToText(const std::vector<ExtractedReference>& references,
                                           const std::string& timestamp) {
    const std::string rule(50, '=');
    std::ostringstream ss;
    ss << "EXTRACTED REFERENCES REPORT\n" << rule << "\n\n";
    ss << "Total References: " << references.size() << "\n";
    ss << "Extraction Date: " << timestamp << "\n\n";

    for (size_t i = 0; i < references.size(); ++i) {
        const auto& ref = references[i];
        ss << "REFERENCE " << (i + 1) << "\n" << std::string(20, '-') << "\n";
        if (ref.sequenceNumber) ss << "Number: " << *ref.sequenceNumber << "\n";
        ss << "Full Text: " << ref.fullText << "\n\n";
        for (const auto& [label, value] : PresentFields(ref)) {
            ss << label << ": " << value << "\n";
        }
        ss << "\n" << rule << "\n\n";
    }
    return ss.str();
}

std::string ReferenceExportService::ToMarkdown(const std::vector<ExtractedReference>& references,
                                               const std::string& timestamp) {
    std::ostringstream ss;
    ss << "# Extracted References Report\n\n";
    ss << "**Total References:** " << references.size() << "  \n";
    ss << "**Extraction Date:** " << timestamp << "  \n\n";

    if (!references.empty()) {
        ss << "**Average Confidence Score:** " << FormatScore(AverageConfidence(references)) << "  \n\n";

        std::map<std::string, int> typeCounts;
        for (const auto& ref : references) {
            typeCounts[ReferenceTypeToString(ref.referenceType)]++;
        }
        ss << "## Reference Types Summary\n\n";
        for (const auto& [type, count] : typeCounts) {
            ss << "- **" << Capitalize(type) << ":** " << count << "\n";
        }
        ss << "\n";
    }

    ss << "## Detailed References\n\n";
    for (size_t i = 0; i < references.size(); ++i) {
        const auto& ref = references[i];
        ss << "### Reference " << (i + 1) << "\n\n";
        if (ref.sequenceNumber) ss << "**Reference Number:** " << *ref.sequenceNumber << "  \n";
        ss << "**Full Text:** " << ref.fullText << "  \n\n";
        ss << "| Field | Value |\n|-------|-------|\n";
        for (const auto& [label, value] : PresentFields(ref)) {
            ss << "| " << label << " | " << MarkdownCell(value) << " |\n";
        }
        ss << "\n---\n\n";
    }
    return ss.str();
}

std::string ReferenceExportService::CurrentTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &now);
#else
    localtime_r(&now, &tm);
#endif
    char buffer[64];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm);
    return buffer;
}

} // namespace citewalker::application
