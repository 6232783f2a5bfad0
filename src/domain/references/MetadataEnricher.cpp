/**
 * @file MetadataEnricher.cpp
 * @brief Implementation of MetadataEnricher.
 */

#include "domain/references/MetadataEnricher.hpp"
#include "domain/references/TextNormalization.hpp"

#include <regex>
#include <vector>

namespace citewalker::domain::references {

namespace {

constexpr auto kIcase = std::regex::ECMAScript | std::regex::icase;

std::string FirstGroup(const std::string& text, const std::regex& re) {
    std::smatch m;
    if (std::regex_search(text, m, re) && m.size() > 1 && m[1].matched) {
        return m[1].str();
    }
    return {};
}

// Identifiers at the end of a sentence pick up its punctuation.
std::string StripTrailingPunctuation(std::string value) {
    while (!value.empty()) {
        char c = value.back();
        if (c == '.' || c == ',' || c == ';' || c == ')' || c == ']') {
            value.pop_back();
        } else {
            break;
        }
    }
    return value;
}

struct TypeRule {
    ReferenceType type;
    std::vector<std::string> keywords;
};

const std::vector<TypeRule>& TypeRules() {
    static const std::vector<TypeRule> rules = {
        {ReferenceType::Journal, {"journal", "vol.", "volume", "issue"}},
        {ReferenceType::Conference, {"proceedings", "conference", "symposium"}},
        {ReferenceType::Book, {"book", "publisher", "press"}},
        {ReferenceType::Website, {"http://", "https://", "www."}},
        {ReferenceType::Thesis, {"thesis", "dissertation"}}
    };
    return rules;
}

} // namespace

void MetadataEnricher::enrich(ExtractedReference& reference, const std::string& sourceText) const {
    // Repetitions are bounded: libstdc++ recurses once per matched character.
    static const std::regex doi(R"((?:doi:)\s{0,8}(10\.\d{1,9}/\S{1,512}))", kIcase);
    static const std::regex url(R"((https?://\S{1,2048}))");
    static const std::regex isbn(R"((?:ISBN:?\s{0,8})((?:\d{3}-)?\d{1,5}-\d{1,7}-\d{1,7}-[\dX]))", kIcase);
    static const std::regex volume(R"((?:vol\.?\s{0,8}|volume\s{0,8})(\d{1,9}))", kIcase);
    static const std::regex issue(R"((?:no\.?\s{0,8}|issue\s{0,8}|number\s{0,8})(\d{1,9}))", kIcase);
    static const std::regex pages(R"((?:pp?\.?\s{0,8}|pages?\s{0,8})([\d-]{1,32}))", kIcase);

    if (auto value = StripTrailingPunctuation(FirstGroup(sourceText, doi)); !value.empty()) {
        reference.doi = value;
    }
    if (auto value = StripTrailingPunctuation(FirstGroup(sourceText, url)); !value.empty()) {
        reference.url = value;
    }
    if (auto value = FirstGroup(sourceText, isbn); !value.empty()) {
        reference.isbn = value;
    }
    if (auto value = FirstGroup(sourceText, volume); !value.empty()) {
        reference.volume = value;
    }
    if (auto value = FirstGroup(sourceText, issue); !value.empty()) {
        reference.issue = value;
    }
    if (auto value = FirstGroup(sourceText, pages); !value.empty()) {
        reference.pages = value;
    }

    reference.referenceType = ClassifyType(sourceText);
}

ReferenceType MetadataEnricher::ClassifyType(const std::string& sourceText) {
    for (const auto& rule : TypeRules()) {
        if (ContainsAny(sourceText, rule.keywords)) return rule.type;
    }
    return ReferenceType::Unknown;
}

} // namespace citewalker::domain::references
