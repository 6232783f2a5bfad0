#include <cassert>
#include <iostream>
#include <set>
#include <string>

#include "application/ReferenceParsingPipeline.hpp"
#include "domain/references/ExtractionErrors.hpp"

using namespace citewalker::application;
using namespace citewalker::domain::references;

int main() {
    std::cout << "[Test] Starting ReferenceParsingPipeline Test..." << std::endl;
    ReferenceParsingPipeline pipeline;

    // Single APA journal reference
    {
        auto refs = pipeline.extractReferences(
            "[1] Smith, J. A. (2023). Machine learning in research. AI Journal, 15(3), 45-62.");
        assert(refs.size() == 1 && "Both segmentation passes converge to one reference.");
        const auto& ref = refs[0];
        assert(ref.sequenceNumber == 1);
        assert(ref.authors.size() == 1 && ref.authors[0] == "Smith, J. A.");
        assert(ref.year == 2023);
        assert(ref.title == "Machine learning in research");
        assert(ref.venue == "AI Journal");
        assert(ref.referenceType == ReferenceType::Journal);
        assert(ref.citationStyle == CitationStyle::Apa);
        assert(ref.provenance == SegmentationStrategy::BracketNumbered);
        assert(ref.matchConfidence == 0.8f);
        assert(ref.confidenceScore == 1.0f);
    }

    // APA book without markers
    {
        auto refs = pipeline.extractReferences(
            "Johnson, M., & Brown, K. (2022). Data Science Fundamentals. Academic Press.");
        assert(refs.size() == 1);
        assert(refs[0].year == 2022);
        assert(refs[0].title == "Data Science Fundamentals");
        assert(refs[0].venue == "Academic Press");
        assert(refs[0].referenceType == ReferenceType::Book);
        assert(refs[0].provenance == SegmentationStrategy::LineBased);
    }

    // Near-duplicate titles collapse
    {
        auto refs = pipeline.extractReferences(
            "References\n"
            "[1] Lee, K. (2021). Automated citation analysis. Journal of Informetrics, 12(1), 1-10.\n"
            "[2] Lee, K. (2021). Automated Citation Analysis. Journal of Informetrics.\n");
        assert(refs.size() == 1);
        assert(refs[0].title == "Automated citation analysis");
    }

    // Implausible year
    {
        auto refs = pipeline.extractReferences(
            "[1] Smith, J. A. (2125). Future of research methods. AI Journal, 15(3), 45-62.");
        assert(refs.size() == 1);
        assert(!refs[0].year.has_value());
        assert(refs[0].notes.find("Invalid year detected.") != std::string::npos);
        assert(refs[0].confidenceScore < 1.0f);
    }

    // Too short to be a reference
    {
        auto refs = pipeline.extractReferences("[1] Short ref.");
        assert(refs.empty());
    }

    // Blank input
    {
        bool thrown = false;
        try {
            pipeline.extractReferences("   \n\t ");
        } catch (const MalformedInputError&) {
            thrown = true;
        }
        assert(thrown);
    }

    // n numbered references give n results, all scored within bounds
    {
        const std::string text =
            "Introduction\n"
            "Prose without any numbered markers.\n"
            "\n"
            "References\n"
            "[1] Smith, J. A. (2023). Machine learning in research. AI Journal, 15(3), 45-62.\n"
            "[2] Johnson, M., & Brown, K. (2022). Data Science Fundamentals. Academic Press.\n"
            "[3] A. Turing, K. Brown, \"Computing machinery,\" Mind Journal, vol. 59, no. 236, pp. 433-460, 1950.\n"
            "[4] an unstructured reference that no grammar recognises at all\n"
            "\n"
            "Acknowledgments\n"
            "We thank the reviewers.\n";
        auto refs = pipeline.extractReferences(text);
        assert(refs.size() == 4);

        std::set<int> numbers;
        for (const auto& ref : refs) {
            assert(ref.confidenceScore >= 0.0f && ref.confidenceScore <= 1.0f);
            if (ref.sequenceNumber) numbers.insert(*ref.sequenceNumber);
        }
        assert((numbers == std::set<int>{1, 2, 3, 4}));
        assert(refs[2].citationStyle == CitationStyle::Ieee);
        assert(refs[2].volume == "59" && refs[2].issue == "236" && refs[2].pages == "433-460");
        assert(refs[3].citationStyle == CitationStyle::Unknown);
        assert(refs[3].confidenceScore == 0.0f);

        auto kept = ReferenceParsingPipeline::FilterByConfidence(refs, 0.3f);
        assert(kept.size() == 3);
        assert(ReferenceParsingPipeline::FilterByConfidence(refs, 0.0f).size() == 4);
    }

    // A garbage run inside a reference is carried through without crashing
    {
        const std::string text = "[1] Smith, J. A. (2023). Title here. Venue, 1. https://example.org/" + std::string(50000, 'a');
        auto refs = pipeline.extractReferences(text);
        assert(refs.size() == 1);
        assert(refs[0].sequenceNumber == 1);
        assert(refs[0].url.rfind("https://example.org/", 0) == 0);
    }

    std::cout << "[PASS] ReferenceParsingPipeline Test Complete." << std::endl;
    return 0;
}
