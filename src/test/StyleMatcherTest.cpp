#include <cassert>
#include <iostream>
#include <string>

#include "domain/references/CitationStyleMatcher.hpp"

using namespace citewalker::domain::references;

namespace {

ReferenceCandidate Candidate(const std::string& text, std::optional<int> number = std::nullopt) {
    ReferenceCandidate candidate;
    candidate.text = text;
    candidate.sequenceNumber = number;
    candidate.provenance = number ? SegmentationStrategy::BracketNumbered : SegmentationStrategy::LineBased;
    return candidate;
}

} // namespace

int main() {
    std::cout << "[Test] Starting CitationStyleMatcher Test..." << std::endl;
    CitationStyleMatcher matcher;

    // APA journal
    {
        auto ref = matcher.match(Candidate("[1] Smith, J. A. (2023). Machine learning in research. AI Journal, 15(3), 45-62.", 1));
        assert(ref.citationStyle == CitationStyle::Apa);
        assert(ref.sequenceNumber == 1);
        assert(ref.authors.size() == 1 && ref.authors[0] == "Smith, J. A.");
        assert(ref.year == 2023);
        assert(ref.title == "Machine learning in research");
        assert(ref.venue == "AI Journal");
        assert(ref.matchConfidence == CitationStyleMatcher::MatchedConfidence);
        assert(ref.notes.empty());
    }

    // APA book with two authors
    {
        auto ref = matcher.match(Candidate("Johnson, M., & Brown, K. (2022). Data Science Fundamentals. Academic Press."));
        assert(ref.citationStyle == CitationStyle::Apa);
        assert(ref.year == 2022);
        assert(ref.title == "Data Science Fundamentals");
        assert(ref.venue == "Academic Press");
        assert(ref.authors.size() == 2);
        assert(ref.authors[0] == "Johnson, M." && ref.authors[1] == "Brown, K.");
    }

    // MLA journal
    {
        auto ref = matcher.match(Candidate(
            "Smith, John. \"Deep learning methods.\" Nature Reviews, vol. 12, no. 3, 2021, pp. 100-120."));
        assert(ref.citationStyle == CitationStyle::Mla);
        assert(ref.title == "Deep learning methods");
        assert(ref.venue == "Nature Reviews");
        assert(ref.year == 2021);
    }

    // MLA book
    {
        auto ref = matcher.match(Candidate("Smith, John. Some Great Book. Penguin, 2001."));
        assert(ref.citationStyle == CitationStyle::Mla);
        assert(ref.title == "Some Great Book");
        assert(ref.venue == "Penguin");
        assert(ref.year == 2001);
    }

    // Chicago journal
    {
        auto ref = matcher.match(Candidate(
            "Smith, John Paul. \"Network effects in science.\" Science Quarterly 12, no. 4 (2018): 22-40."));
        assert(ref.citationStyle == CitationStyle::Chicago);
        assert(ref.authors.size() == 1 && ref.authors[0] == "Smith, John Paul");
        assert(ref.title == "Network effects in science");
        assert(ref.venue == "Science Quarterly");
        assert(ref.year == 2018);
    }

    // IEEE journal sets the sequence number from the marker
    {
        auto ref = matcher.match(Candidate(
            "[2] A. Turing, K. Brown, \"Computing machinery,\" Mind Journal, vol. 59, no. 236, pp. 433-460, 1950."));
        assert(ref.citationStyle == CitationStyle::Ieee);
        assert(ref.sequenceNumber == 2);
        assert(ref.authors.size() == 2);
        assert(ref.authors[0] == "A. Turing" && ref.authors[1] == "K. Brown");
        assert(ref.title == "Computing machinery");
        assert(ref.venue == "Mind Journal");
        assert(ref.year == 1950);
    }

    // Unmatched
    {
        auto ref = matcher.match(Candidate("some lowercase text that follows no citation convention at all"));
        assert(ref.citationStyle == CitationStyle::Unknown);
        assert(ref.confidenceScore == CitationStyleMatcher::UnmatchedConfidence);
        assert(ref.notes.find("Pattern matching failed") != std::string::npos);
        assert(ref.title.empty() && ref.authors.empty());
        assert(ref.fullText == "some lowercase text that follows no citation convention at all");
    }

    // Precedence: grammar order is APA, MLA, Chicago, IEEE
    {
        const auto& grammars = CitationStyleMatcher::Grammars();
        assert(grammars.size() == 8);
        const CitationStyle order[] = {CitationStyle::Apa, CitationStyle::Mla, CitationStyle::Chicago, CitationStyle::Ieee};
        for (size_t i = 0; i < grammars.size(); ++i) {
            assert(grammars[i].style == order[i / 2]);
        }

        // Matches MLA book and APA journal; APA wins.
        auto ref = matcher.match(Candidate(
            "Smith, John. Some Great Book. Penguin, 2001. Smith, J. (2020). Title of work. Venue Name, 5."));
        assert(ref.citationStyle == CitationStyle::Apa);
        assert(ref.year == 2020);
    }

    // Oversized spans are not matched
    {
        std::string longText = "Smith, J. A. (2023). Machine learning in research. AI Journal, 15(3), 45-62. ";
        longText += std::string(CitationStyleMatcher::MaxMatchLength, 'x');
        auto ref = matcher.match(Candidate(longText));
        assert(ref.citationStyle == CitationStyle::Unknown);
    }

    // Author splitting
    {
        auto authors = CitationStyleMatcher::SplitAuthors("Doe, A., Roe, B. and Poe, C.");
        assert(authors.size() == 2);
        assert(authors[0] == "Doe, A., Roe, B." && authors[1] == "Poe, C.");
    }

    std::cout << "[PASS] CitationStyleMatcher Test Complete." << std::endl;
    return 0;
}
