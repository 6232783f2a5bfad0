#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "domain/references/ReferenceDeduplicator.hpp"

using namespace citewalker::domain::references;

namespace {

ExtractedReference Make(const std::string& title, float confidence, const std::string& fullText = "") {
    ExtractedReference ref;
    ref.title = title;
    ref.confidenceScore = confidence;
    ref.fullText = fullText.empty() ? title : fullText;
    return ref;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ReferenceDeduplicator Test..." << std::endl;
    ReferenceDeduplicator deduplicator;

    // Case and trailing punctuation do not make a new reference; higher confidence wins.
    {
        std::vector<ExtractedReference> refs = {
            Make("Automated citation analysis", 0.5f),
            Make("Automated Citation Analysis.", 0.8f)
        };
        auto result = deduplicator.deduplicate(refs);
        assert(result.size() == 1);
        assert(result[0].confidenceScore == 0.8f);
        assert(result[0].title == "Automated Citation Analysis.");

        std::vector<ExtractedReference> reversed = {refs[1], refs[0]};
        auto result2 = deduplicator.deduplicate(reversed);
        assert(result2.size() == 1);
        assert(result2[0].confidenceScore == 0.8f);
    }

    // Equal confidence keeps the first occurrence in its position
    {
        std::vector<ExtractedReference> refs = {
            Make("First distinct paper", 0.8f),
            Make("Graph neural networks survey", 0.8f),
            Make("Graph Neural Networks Survey", 0.8f),
            Make("Another distinct paper entirely", 0.8f)
        };
        auto result = deduplicator.deduplicate(refs);
        assert(result.size() == 3);
        assert(result[1].title == "Graph neural networks survey");
        assert(result[2].title == "Another distinct paper entirely");
    }

    // Without titles the full text is compared with the stricter threshold
    {
        ExtractedReference a = Make("", 0.3f, "Unparsed reference text about deep citation mining methods");
        ExtractedReference b = Make("", 0.3f, "Unparsed reference text about deep citation mining methods.");
        ExtractedReference c = Make("", 0.3f, "Unparsed reference text about shallow parsing");
        assert(ReferenceDeduplicator::AreSimilar(a, b));
        assert(!ReferenceDeduplicator::AreSimilar(a, c));
        assert(deduplicator.deduplicate({a, b, c}).size() == 2);
    }

    // Idempotence
    {
        std::vector<ExtractedReference> refs = {
            Make("Learning to rank", 0.4f),
            Make("Learning to Rank.", 0.6f),
            Make("Citation intent classification", 0.7f),
            Make("Unrelated topic", 0.2f)
        };
        auto once = deduplicator.deduplicate(refs);
        auto twice = deduplicator.deduplicate(once);
        assert(once.size() == twice.size());
        for (size_t i = 0; i < once.size(); ++i) {
            assert(once[i].title == twice[i].title);
            assert(once[i].confidenceScore == twice[i].confidenceScore);
        }
    }

    // A replacement that is similar to a later accepted entry absorbs it
    {
        const std::string base = "alpha beta gamma delta epsilon zeta eta theta iota kappa";
        std::vector<ExtractedReference> refs = {
            Make(base, 0.3f),
            Make(base + " lambda mu nu", 0.3f),
            Make(base + " lambda", 0.8f)
        };
        assert(!ReferenceDeduplicator::AreSimilar(refs[0], refs[1]));
        assert(ReferenceDeduplicator::AreSimilar(refs[0], refs[2]));
        assert(ReferenceDeduplicator::AreSimilar(refs[1], refs[2]));

        auto once = deduplicator.deduplicate(refs);
        auto twice = deduplicator.deduplicate(once);
        assert(once.size() == 1);
        assert(twice.size() == 1);
        assert(once[0].title == base + " lambda");
        assert(once[0].confidenceScore == 0.8f);
    }

    std::cout << "[PASS] ReferenceDeduplicator Test Complete." << std::endl;
    return 0;
}
