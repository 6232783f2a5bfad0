/**
 * @file TextNormalization.cpp
 * @brief Implementation of the pipeline string helpers.
 */

#include "domain/references/TextNormalization.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace citewalker::domain::references {

namespace {

bool IsStripChar(unsigned char c) {
    return std::isspace(c) || c == '.' || c == ',' || c == ';' || c == ':';
}

} // namespace

std::string ToLower(const std::string& input) {
    std::string out = input;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return std::tolower(c); });
    return out;
}

std::string Trim(const std::string& input) {
    const char* ws = " \t\r\n\f\v";
    size_t start = input.find_first_not_of(ws);
    if (start == std::string::npos) return {};
    size_t end = input.find_last_not_of(ws);
    return input.substr(start, end - start + 1);
}

std::string CollapseWhitespace(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    bool lastWasSpace = false;
    for (unsigned char c : input) {
        if (std::isspace(c)) {
            if (!lastWasSpace) {
                out.push_back(' ');
                lastWasSpace = true;
            }
            continue;
        }
        out.push_back(static_cast<char>(c));
        lastWasSpace = false;
    }
    return out;
}

std::string CleanReferenceText(const std::string& input) {
    if (input.empty()) return {};
    std::string collapsed = CollapseWhitespace(input);

    size_t start = 0;
    while (start < collapsed.size() && IsStripChar(static_cast<unsigned char>(collapsed[start]))) ++start;
    size_t end = collapsed.size();
    while (end > start && IsStripChar(static_cast<unsigned char>(collapsed[end - 1]))) --end;
    return collapsed.substr(start, end - start);
}

std::vector<std::string> SplitLines(const std::string& input) {
    std::vector<std::string> lines;
    std::stringstream ss(input);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::unordered_set<std::string> WordSet(const std::string& input) {
    std::unordered_set<std::string> words;
    std::stringstream ss(ToLower(input));
    std::string word;
    while (ss >> word) {
        size_t start = 0;
        while (start < word.size() && std::ispunct(static_cast<unsigned char>(word[start]))) ++start;
        size_t end = word.size();
        while (end > start && std::ispunct(static_cast<unsigned char>(word[end - 1]))) --end;
        if (end > start) {
            words.insert(word.substr(start, end - start));
        }
    }
    return words;
}

double JaccardSimilarity(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return 0.0;

    const std::string lowerA = ToLower(a);
    const std::string lowerB = ToLower(b);
    if (lowerA == lowerB) return 1.0;

    const auto wordsA = WordSet(lowerA);
    const auto wordsB = WordSet(lowerB);

    size_t intersection = 0;
    for (const auto& word : wordsA) {
        if (wordsB.count(word)) ++intersection;
    }
    const size_t unionSize = wordsA.size() + wordsB.size() - intersection;
    if (unionSize == 0) return 0.0;

    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
    const std::string lowered = ToLower(haystack);
    for (const auto& needle : needles) {
        if (lowered.find(needle) != std::string::npos) return true;
    }
    return false;
}

} // namespace citewalker::domain::references
