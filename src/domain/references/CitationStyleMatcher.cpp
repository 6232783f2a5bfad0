/**
 * @file CitationStyleMatcher.cpp
 * @brief Grammar definitions and matching logic.
 */

#include "domain/references/CitationStyleMatcher.hpp"
#include "domain/references/TextNormalization.hpp"

namespace citewalker::domain::references {

namespace {

// Capitalized surname followed by initials: "Smith, J. A."
constexpr const char* kApaAuthor = R"([A-Z][a-z]+(?:,\s*[A-Z]\.(?:\s*[A-Z]\.)?)*)";
// "Smith, John"
constexpr const char* kMlaAuthor = R"([A-Z][a-z]+,\s*[A-Z][a-z]+)";
// "Smith, John Paul"
constexpr const char* kChicagoAuthor = R"([A-Z][a-z]+,\s*[A-Z][a-z]+(?:\s+[A-Z][a-z]+)*)";
// "J. Smith, K. Brown"
constexpr const char* kIeeeAuthors = R"([A-Z]\.\s*[A-Z][a-z]+(?:,\s*[A-Z]\.\s*[A-Z][a-z]+)*)";

std::optional<int> ParseYear(const std::string& digits) {
    if (digits.size() != 4) return std::nullopt;
    for (char c : digits) {
        if (c < '0' || c > '9') return std::nullopt;
    }
    return std::stoi(digits);
}

std::optional<int> ParseNumber(const std::string& digits) {
    if (digits.empty() || digits.size() > 9) return std::nullopt;
    return std::stoi(digits);
}

std::string Group(const std::smatch& m, size_t index) {
    if (index >= m.size() || !m[index].matched) return {};
    return Trim(m[index].str());
}

std::vector<std::string> SplitIeeeAuthors(const std::string& group) {
    static const std::regex name(R"([A-Z]\.\s*[A-Z][a-z]+)");
    std::vector<std::string> authors;
    for (std::sregex_iterator it(group.begin(), group.end(), name), end; it != end; ++it) {
        authors.push_back(Trim(it->str()));
    }
    return authors;
}

std::regex Compile(const std::string& pattern) {
    return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
}

std::vector<StyleGrammar> BuildGrammars() {
    const std::string apa = kApaAuthor;
    const std::string mla = kMlaAuthor;
    const std::string chicago = kChicagoAuthor;
    const std::string ieee = kIeeeAuthors;

    std::vector<StyleGrammar> grammars;

    // Author, A. A. (Year). Title. Journal, Volume(Issue), pages.
    grammars.push_back({CitationStyle::Apa, "journal",
        Compile("(" + apa + R"()\s*\((\d{4})\)\.\s*([^.]+)\.\s*([^,]+)(?:,\s*(\d+)(?:\((\d+)\))?)(?:,\s*([\d-]+))?)"),
        [](const std::smatch& m, ExtractedReference& ref) {
            ref.authors = CitationStyleMatcher::SplitAuthors(Group(m, 1));
            ref.year = ParseYear(Group(m, 2));
            ref.title = Group(m, 3);
            ref.venue = Group(m, 4);
        }});

    // Author, A. A., & Author, B. B. (Year). Book title. Publisher.
    grammars.push_back({CitationStyle::Apa, "book",
        Compile("(" + apa + R"((?:,?\s*&\s*)" + apa + R"()*)\s*\((\d{4})\)\.\s*([^.]+)\.\s*([^.]+)\.)"),
        [](const std::smatch& m, ExtractedReference& ref) {
            ref.authors = CitationStyleMatcher::SplitAuthors(Group(m, 1));
            ref.year = ParseYear(Group(m, 2));
            ref.title = Group(m, 3);
            ref.venue = Group(m, 4);
        }});

    // Author, First. "Title." Journal, vol. #, no. #, Year, pp. #-#.
    grammars.push_back({CitationStyle::Mla, "journal",
        Compile("(" + mla + R"()\.\s*"([^"]+?)[.,]?"\.?\s*([^,]+),\s*vol\.\s*(\d+)(?:,\s*no\.\s*(\d+))?,\s*(\d{4}),\s*pp\.\s*([\d-]+))"),
        [](const std::smatch& m, ExtractedReference& ref) {
            ref.authors = CitationStyleMatcher::SplitAuthors(Group(m, 1));
            ref.title = Group(m, 2);
            ref.venue = Group(m, 3);
            ref.year = ParseYear(Group(m, 6));
        }});

    // Author, First. Book Title. Publisher, Year.
    grammars.push_back({CitationStyle::Mla, "book",
        Compile("(" + mla + R"()\.\s*([^.]+)\.\s*([^,]+),\s*(\d{4})\.)"),
        [](const std::smatch& m, ExtractedReference& ref) {
            ref.authors = CitationStyleMatcher::SplitAuthors(Group(m, 1));
            ref.title = Group(m, 2);
            ref.venue = Group(m, 3);
            ref.year = ParseYear(Group(m, 4));
        }});

    // Author, First Last. "Title." Journal Volume, no. Issue (Year): pages.
    grammars.push_back({CitationStyle::Chicago, "journal",
        Compile("(" + chicago + R"()\.\s*"([^"]+?)[.,]?"\.?\s*([^0-9"]+)\s*(\d+)(?:,\s*no\.\s*(\d+))?\s*\((\d{4})\):\s*([\d-]+))"),
        [](const std::smatch& m, ExtractedReference& ref) {
            ref.authors = CitationStyleMatcher::SplitAuthors(Group(m, 1));
            ref.title = Group(m, 2);
            ref.venue = Group(m, 3);
            ref.year = ParseYear(Group(m, 6));
        }});

    // Author, First Last. Book Title. Place: Publisher, Year.
    grammars.push_back({CitationStyle::Chicago, "book",
        Compile("(" + chicago + R"()\.\s*([^.]+)\.\s*[^:]+:\s*([^,]+),\s*(\d{4})\.)"),
        [](const std::smatch& m, ExtractedReference& ref) {
            ref.authors = CitationStyleMatcher::SplitAuthors(Group(m, 1));
            ref.title = Group(m, 2);
            ref.venue = Group(m, 3);
            ref.year = ParseYear(Group(m, 4));
        }});

    // [1] A. Author, "Title," Journal, vol. #, no. #, pp. #-#, Year.
    grammars.push_back({CitationStyle::Ieee, "journal",
        Compile(R"(\[(\d+)\]\s*()" + ieee + R"(),\s*"([^"]+?),?",?\s*([^,]+),\s*vol\.\s*(\d+)(?:,\s*no\.\s*(\d+))?,\s*pp\.\s*([\d-]+),\s*(\d{4}))"),
        [](const std::smatch& m, ExtractedReference& ref) {
            if (auto number = ParseNumber(Group(m, 1))) ref.sequenceNumber = number;
            ref.authors = SplitIeeeAuthors(Group(m, 2));
            ref.title = Group(m, 3);
            ref.venue = Group(m, 4);
            ref.year = ParseYear(Group(m, 8));
        }});

    // [1] A. Author, Book Title. Publisher, Year.
    grammars.push_back({CitationStyle::Ieee, "book",
        Compile(R"(\[(\d+)\]\s*()" + ieee + R"(),\s*([^.]+)\.\s*([^,]+),\s*(\d{4})\.)"),
        [](const std::smatch& m, ExtractedReference& ref) {
            if (auto number = ParseNumber(Group(m, 1))) ref.sequenceNumber = number;
            ref.authors = SplitIeeeAuthors(Group(m, 2));
            ref.title = Group(m, 3);
            ref.venue = Group(m, 4);
            ref.year = ParseYear(Group(m, 5));
        }});

    return grammars;
}

} // namespace

const std::vector<StyleGrammar>& CitationStyleMatcher::Grammars() {
    static const std::vector<StyleGrammar> grammars = BuildGrammars();
    return grammars;
}

std::vector<std::string> CitationStyleMatcher::SplitAuthors(const std::string& authorGroup) {
    static const std::regex separator(R"(\s*&\s*|\s+and\s+)");
    std::vector<std::string> authors;
    for (std::sregex_token_iterator it(authorGroup.begin(), authorGroup.end(), separator, -1), end; it != end; ++it) {
        std::string name = Trim(it->str());
        while (!name.empty() && (name.back() == ',' || name.back() == ' ')) name.pop_back();
        if (!name.empty()) authors.push_back(name);
    }
    return authors;
}

ExtractedReference CitationStyleMatcher::match(const ReferenceCandidate& candidate) const {
    ExtractedReference reference;
    reference.sequenceNumber = candidate.sequenceNumber;
    reference.fullText = candidate.text;
    reference.provenance = candidate.provenance;

    // Grammars only run on reference-sized spans.
    const bool matchable = candidate.text.size() <= MaxMatchLength;
    for (const auto& grammar : Grammars()) {
        if (!matchable) break;
        std::smatch m;
        if (std::regex_search(candidate.text, m, grammar.pattern)) {
            reference.citationStyle = grammar.style;
            reference.matchConfidence = MatchedConfidence;
            reference.confidenceScore = MatchedConfidence;
            grammar.mapFields(m, reference);
            return reference;
        }
    }

    reference.citationStyle = CitationStyle::Unknown;
    reference.matchConfidence = UnmatchedConfidence;
    reference.confidenceScore = UnmatchedConfidence;
    reference.appendNote("Pattern matching failed, basic extraction only.");
    return reference;
}

} // namespace citewalker::domain::references
