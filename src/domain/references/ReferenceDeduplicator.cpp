/**
 * @file ReferenceDeduplicator.cpp
 * @brief Implementation of ReferenceDeduplicator.
 */

#include "domain/references/ReferenceDeduplicator.hpp"
#include "domain/references/TextNormalization.hpp"

#include <algorithm>
#include <cstddef>

namespace citewalker::domain::references {

namespace {

// After accepted[index] changed, folds every entry similar to it into one
// slot until no accepted pair is similar. Winner sits in the earlier slot.
void AbsorbSimilar(std::vector<ExtractedReference>& accepted, size_t index) {
    bool changed = true;
    while (changed) {
        changed = false;
        for (size_t other = 0; other < accepted.size(); ++other) {
            if (other == index || !ReferenceDeduplicator::AreSimilar(accepted[index], accepted[other])) continue;

            size_t earlier = std::min(index, other);
            size_t later = std::max(index, other);
            if (accepted[later].confidenceScore > accepted[earlier].confidenceScore) {
                accepted[earlier] = accepted[later];
            }
            accepted.erase(accepted.begin() + static_cast<std::ptrdiff_t>(later));
            index = earlier;
            changed = true;
            break;
        }
    }
}

} // namespace

bool ReferenceDeduplicator::AreSimilar(const ExtractedReference& a, const ExtractedReference& b) {
    if (!a.title.empty() && !b.title.empty()) {
        return JaccardSimilarity(a.title, b.title) > TitleThreshold;
    }
    return JaccardSimilarity(a.fullText, b.fullText) > FullTextThreshold;
}

std::vector<ExtractedReference> ReferenceDeduplicator::deduplicate(const std::vector<ExtractedReference>& references) const {
    std::vector<ExtractedReference> accepted;
    accepted.reserve(references.size());

    for (const auto& incoming : references) {
        bool duplicate = false;
        for (size_t i = 0; i < accepted.size(); ++i) {
            if (!AreSimilar(incoming, accepted[i])) continue;

            if (incoming.confidenceScore > accepted[i].confidenceScore) {
                accepted[i] = incoming;
                AbsorbSimilar(accepted, i);
            }
            duplicate = true;
            break;
        }
        if (!duplicate) {
            accepted.push_back(incoming);
        }
    }
    return accepted;
}

} // namespace citewalker::domain::references
