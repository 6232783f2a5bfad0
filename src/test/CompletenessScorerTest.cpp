#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "domain/references/CompletenessScorer.hpp"

using namespace citewalker::domain::references;

namespace {

bool Near(float a, float b) { return std::fabs(a - b) < 1e-5f; }

} // namespace

int main() {
    std::cout << "[Test] Starting CompletenessScorer Test..." << std::endl;
    CompletenessScorer scorer;

    // Bounds
    {
        ExtractedReference empty;
        assert(CompletenessScorer::Score(empty) == 0.0f);

        ExtractedReference full;
        full.authors = {"Smith, J."};
        full.title = "Title";
        full.year = 2020;
        full.venue = "Venue";
        full.doi = "10.1/x";
        full.url = "https://x";
        full.volume = "1";
        full.issue = "2";
        full.pages = "3-4";
        assert(CompletenessScorer::Score(full) == 1.0f && "Score is clamped to 1.");
    }

    // Core field weights
    {
        ExtractedReference ref;
        ref.title = "Only a title";
        assert(Near(CompletenessScorer::Score(ref), 0.3f));
        ref.doi = "10.1/x";
        assert(Near(CompletenessScorer::Score(ref), 0.34f));
    }

    // Adding a field never lowers the score
    {
        ExtractedReference ref;
        std::vector<void (*)(ExtractedReference&)> steps = {
            [](ExtractedReference& r) { r.pages = "1-2"; },
            [](ExtractedReference& r) { r.venue = "Venue"; },
            [](ExtractedReference& r) { r.year = 1999; },
            [](ExtractedReference& r) { r.url = "https://x"; },
            [](ExtractedReference& r) { r.authors = {"Doe, A."}; },
            [](ExtractedReference& r) { r.title = "Title"; },
            [](ExtractedReference& r) { r.issue = "3"; },
            [](ExtractedReference& r) { r.volume = "4"; },
            [](ExtractedReference& r) { r.doi = "10.1/y"; }
        };
        float previous = CompletenessScorer::Score(ref);
        for (auto step : steps) {
            step(ref);
            float current = CompletenessScorer::Score(ref);
            assert(current >= previous);
            assert(current >= 0.0f && current <= 1.0f);
            previous = current;
        }
    }

    // Out-of-range year is dropped with a note
    {
        ExtractedReference ref;
        ref.authors = {"Smith, J."};
        ref.title = "Future of research";
        ref.venue = "AI Journal";
        ref.year = 2125;
        scorer.finalize(ref);
        assert(!ref.year.has_value());
        assert(ref.notes.find("Invalid year") != std::string::npos);
        assert(Near(ref.confidenceScore, 0.8f));
    }

    // Year boundaries
    {
        ExtractedReference low;
        low.year = 1899;
        scorer.finalize(low);
        assert(!low.year);

        ExtractedReference first;
        first.year = 1900;
        scorer.finalize(first);
        assert(first.year == 1900 && first.notes.empty());

        ExtractedReference last;
        last.year = 2030;
        scorer.finalize(last);
        assert(last.year == 2030);
    }

    // Text cleanup
    {
        std::vector<ExtractedReference> refs(1);
        refs[0].fullText = "  [1] Some   reference text.  ";
        refs[0].title = " Title with trailing dot. ";
        refs[0].venue = "Venue,";
        scorer.finalizeAll(refs);
        assert(refs[0].fullText == "[1] Some reference text");
        assert(refs[0].title == "Title with trailing dot");
        assert(refs[0].venue == "Venue");
    }

    std::cout << "[PASS] CompletenessScorer Test Complete." << std::endl;
    return 0;
}
