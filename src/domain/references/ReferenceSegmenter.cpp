/**
 * @file ReferenceSegmenter.cpp
 * @brief Implementation of ReferenceSegmenter.
 */

#include "domain/references/ReferenceSegmenter.hpp"
#include "domain/references/TextNormalization.hpp"

#include <array>
#include <regex>

namespace citewalker::domain::references {

namespace {

const std::array<const char*, 5> kSectionHeaders = {
    "references", "bibliography", "works cited", "literature cited", "citations"
};

const std::array<const char*, 4> kTrailingHeaders = {
    "appendix", "acknowledgment", "author information", "about the author"
};

const std::regex& BracketMarker() {
    static const std::regex re(R"(\[(\d+)\])");
    return re;
}

const std::regex& BlankLine() {
    static const std::regex re(R"(\n[ \t\r\f\v]*\n)");
    return re;
}

std::optional<int> ParseSequenceNumber(const std::string& digits) {
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    return std::stoi(digits);
}

struct Line {
    size_t begin;   ///< Offset of the first character.
    size_t end;     ///< Offset one past the newline (or end of text).
    std::string normalized;
};

std::vector<Line> IndexLines(const std::string& text) {
    std::vector<Line> lines;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t nl = text.find('\n', pos);
        size_t lineEnd = (nl == std::string::npos) ? text.size() : nl;
        Line line;
        line.begin = pos;
        line.end = (nl == std::string::npos) ? text.size() : nl + 1;
        line.normalized = ToLower(CollapseWhitespace(Trim(text.substr(pos, lineEnd - pos))));
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        pos = nl + 1;
    }
    return lines;
}

ReferenceCandidate MakeNumbered(int number, const std::string& body, SegmentationStrategy strategy) {
    ReferenceCandidate candidate;
    candidate.text = "[" + std::to_string(number) + "] " + body;
    candidate.sequenceNumber = number;
    candidate.provenance = strategy;
    return candidate;
}

std::string StripMarker(const std::string& text) {
    static const std::regex leading(R"(^\[\d+\]\s*)");
    return std::regex_replace(text, leading, "");
}

} // namespace

ReferenceSegmenter::ReferenceSegmenter(size_t minReferenceLength)
    : m_minReferenceLength(minReferenceLength) {}

std::vector<ReferenceCandidate> ReferenceSegmenter::segment(const std::string& text) const {
    std::vector<ReferenceCandidate> candidates;

    // No header: the whole document acts as the region.
    const std::string region = findReferenceSection(text).value_or(text);

    for (auto& candidate : splitRegion(region)) {
        if (isLongEnough(candidate)) candidates.push_back(std::move(candidate));
    }
    for (auto& candidate : findNumberedReferences(text)) {
        if (isLongEnough(candidate)) candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::optional<std::string> ReferenceSegmenter::findReferenceSection(const std::string& text) const {
    const auto lines = IndexLines(text);

    for (const char* header : kSectionHeaders) {
        for (size_t i = 0; i < lines.size(); ++i) {
            if (lines[i].normalized != header) continue;

            const size_t start = lines[i].end;
            size_t end = text.size();
            for (size_t j = i + 1; j < lines.size(); ++j) {
                bool trailing = false;
                for (const char* stop : kTrailingHeaders) {
                    if (lines[j].normalized.rfind(stop, 0) == 0) {
                        trailing = true;
                        break;
                    }
                }
                if (trailing) {
                    end = lines[j].begin;
                    break;
                }
            }
            return Trim(text.substr(start, end - start));
        }
    }
    return std::nullopt;
}

std::vector<ReferenceCandidate> ReferenceSegmenter::splitRegion(const std::string& region) const {
    if (std::regex_search(region, BracketMarker())) {
        return splitOnBrackets(region);
    }
    return splitOnLines(region);
}

std::vector<ReferenceCandidate> ReferenceSegmenter::splitOnBrackets(const std::string& region) const {
    std::vector<ReferenceCandidate> candidates;

    std::vector<std::smatch> markers;
    for (std::sregex_iterator it(region.begin(), region.end(), BracketMarker()), end; it != end; ++it) {
        markers.push_back(*it);
    }

    for (size_t i = 0; i < markers.size(); ++i) {
        const size_t bodyStart = static_cast<size_t>(markers[i].position(0) + markers[i].length(0));
        const size_t bodyEnd = (i + 1 < markers.size())
            ? static_cast<size_t>(markers[i + 1].position(0))
            : region.size();
        const std::string body = Trim(CollapseWhitespace(region.substr(bodyStart, bodyEnd - bodyStart)));
        auto number = ParseSequenceNumber(markers[i][1].str());
        if (body.empty() || !number) continue;
        candidates.push_back(MakeNumbered(*number, body, SegmentationStrategy::BracketNumbered));
    }
    return candidates;
}

std::vector<ReferenceCandidate> ReferenceSegmenter::splitOnLines(const std::string& region) const {
    std::vector<std::string> entries;
    std::string current;

    for (const auto& rawLine : SplitLines(region)) {
        const std::string line = Trim(rawLine);
        if (line.empty()) {
            if (!current.empty()) {
                entries.push_back(current);
                current.clear();
            }
            continue;
        }

        if (IsReferenceStart(line)) {
            if (!current.empty()) entries.push_back(current);
            current = line;
        } else if (!current.empty()) {
            current += " " + line;
        } else {
            current = line;
        }
    }
    if (!current.empty()) entries.push_back(current);

    std::vector<ReferenceCandidate> candidates;
    candidates.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        ReferenceCandidate candidate;
        candidate.text = CollapseWhitespace(entries[i]);
        candidate.sequenceNumber = static_cast<int>(i + 1);
        candidate.provenance = SegmentationStrategy::LineBased;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

std::vector<ReferenceCandidate> ReferenceSegmenter::findNumberedReferences(const std::string& text) const {
    std::vector<ReferenceCandidate> candidates;

    std::vector<std::smatch> markers;
    for (std::sregex_iterator it(text.begin(), text.end(), BracketMarker()), end; it != end; ++it) {
        markers.push_back(*it);
    }

    for (size_t i = 0; i < markers.size(); ++i) {
        const size_t bodyStart = static_cast<size_t>(markers[i].position(0) + markers[i].length(0));
        const size_t bodyEnd = (i + 1 < markers.size())
            ? static_cast<size_t>(markers[i + 1].position(0))
            : text.size();
        std::string body = text.substr(bodyStart, bodyEnd - bodyStart);

        std::smatch blank;
        if (std::regex_search(body, blank, BlankLine())) {
            body = body.substr(0, static_cast<size_t>(blank.position(0)));
        }
        body = Trim(CollapseWhitespace(body));

        auto number = ParseSequenceNumber(markers[i][1].str());
        if (body.empty() || !number) continue;
        candidates.push_back(MakeNumbered(*number, body, SegmentationStrategy::GlobalNumbered));
    }
    return candidates;
}

bool ReferenceSegmenter::IsReferenceStart(const std::string& line) {
    static const std::vector<std::regex> starts = {
        std::regex(R"(^\[\d+\])"),
        std::regex(R"(^\d+\.)"),
        std::regex(R"(^[A-Z][a-z]+,\s*[A-Z]\.)"),
        std::regex(R"(^[A-Z][a-z]+,\s*[A-Z][a-z]+)")
    };
    for (const auto& re : starts) {
        if (std::regex_search(line, re)) return true;
    }
    return false;
}

bool ReferenceSegmenter::isLongEnough(const ReferenceCandidate& candidate) const {
    return Trim(StripMarker(candidate.text)).size() >= m_minReferenceLength;
}

} // namespace citewalker::domain::references
