#include <cassert>
#include <iostream>
#include <string>

#include "domain/references/ReferenceSegmenter.hpp"

using namespace citewalker::domain::references;

namespace {

const std::string kPaper =
    "A Study of Citation Graphs\n"
    "\n"
    "Introduction\n"
    "Graphs are everywhere in scholarly communication.\n"
    "\n"
    "References\n"
    "[1] Smith, J. A. (2023). Machine learning in research. AI Journal, 15(3), 45-62.\n"
    "[2] Johnson, M., & Brown, K. (2022). Data Science Fundamentals. Academic Press.\n"
    "[3] Lee, K. (2021). Automated citation analysis. Journal of Informetrics, 12(1), 1-10.\n";

} // namespace

int main() {
    std::cout << "[Test] Starting ReferenceSegmenter Test..." << std::endl;
    ReferenceSegmenter segmenter;

    // Section detection
    {
        const std::string text = kPaper + "Appendix A\nSupplementary tables.\n";
        auto section = segmenter.findReferenceSection(text);
        assert(section && "References header should be found.");
        assert(section->rfind("[1] Smith", 0) == 0);
        assert(section->find("Appendix") == std::string::npos && "Region must stop at the appendix.");
        assert(section->find("Graphs are everywhere") == std::string::npos);

        assert(!segmenter.findReferenceSection("No bibliography in this text.\nJust prose.\n"));

        auto bibliography = segmenter.findReferenceSection("Body\nBIBLIOGRAPHY\nDoe, A. (2001). Something. Press.\n");
        assert(bibliography && bibliography->rfind("Doe, A.", 0) == 0);
    }

    // Bracket split: n markers give n candidates
    {
        auto section = segmenter.findReferenceSection(kPaper);
        assert(section);
        auto candidates = segmenter.splitRegion(*section);
        assert(candidates.size() == 3);
        for (size_t i = 0; i < candidates.size(); ++i) {
            assert(candidates[i].sequenceNumber == static_cast<int>(i + 1));
            assert(candidates[i].provenance == SegmentationStrategy::BracketNumbered);
            assert(candidates[i].text.rfind("[" + std::to_string(i + 1) + "] ", 0) == 0);
        }
        assert(candidates[1].text == "[2] Johnson, M., & Brown, K. (2022). Data Science Fundamentals. Academic Press.");
    }

    // Line-based split with a wrapped entry
    {
        const std::string region =
            "Smith, J. (2020). A study of things. Journal A, 1(2), 3-4.\n"
            "Doe, A. (2019). Another long\n"
            "study title. Journal B, 2(3), 5-6.\n";
        auto candidates = segmenter.splitRegion(region);
        assert(candidates.size() == 2);
        assert(candidates[0].provenance == SegmentationStrategy::LineBased);
        assert(candidates[1].sequenceNumber == 2);
        assert(candidates[1].text == "Doe, A. (2019). Another long study title. Journal B, 2(3), 5-6.");
    }

    // Global pass stops at a blank line
    {
        auto candidates = segmenter.findNumberedReferences(
            "See [7] Garcia, L. (2018). Long enough reference body. Press.\n\nUnrelated paragraph follows here.");
        assert(candidates.size() == 1);
        assert(candidates[0].sequenceNumber == 7);
        assert(candidates[0].provenance == SegmentationStrategy::GlobalNumbered);
        assert(candidates[0].text.find("Unrelated") == std::string::npos);
    }

    // Both passes contribute
    {
        auto candidates = segmenter.segment(kPaper);
        assert(candidates.size() == 6 && "Region pass and global pass should both emit three candidates.");
        assert(candidates[0].provenance == SegmentationStrategy::BracketNumbered);
        assert(candidates[3].provenance == SegmentationStrategy::GlobalNumbered);
    }

    // Short candidates are dropped
    {
        auto candidates = segmenter.segment("[1] Too short.\n[2] This one is definitely long enough to keep.\n");
        assert(candidates.size() == 2);
        for (const auto& candidate : candidates) {
            assert(candidate.sequenceNumber == 2);
        }
        assert(segmenter.segment("[1] Short ref.").empty());

        ReferenceSegmenter lenient(5);
        assert(lenient.segment("[1] Short ref.").size() == 2);
    }

    // Entry starts
    assert(ReferenceSegmenter::IsReferenceStart("[12] Something"));
    assert(ReferenceSegmenter::IsReferenceStart("3. Something"));
    assert(ReferenceSegmenter::IsReferenceStart("Smith, J. (2020)"));
    assert(ReferenceSegmenter::IsReferenceStart("Smith, John. Title"));
    assert(!ReferenceSegmenter::IsReferenceStart("continued title words"));

    std::cout << "[PASS] ReferenceSegmenter Test Complete." << std::endl;
    return 0;
}
