#include <cassert>
#include <iostream>
#include <string>

#include "domain/references/MetadataEnricher.hpp"

using namespace citewalker::domain::references;

int main() {
    std::cout << "[Test] Starting MetadataEnricher Test..." << std::endl;
    MetadataEnricher enricher;

    {
        const std::string text =
            "[4] Lee, K. (2020). Graph methods. Journal of Graphs, vol. 7, no. 2, pp. 11-19. "
            "doi: 10.1234/jg.2020.7. https://example.org/paper).";
        ExtractedReference ref;
        enricher.enrich(ref, text);
        assert(ref.volume == "7");
        assert(ref.issue == "2");
        assert(ref.pages == "11-19");
        assert(ref.doi == "10.1234/jg.2020.7" && "Trailing sentence punctuation is not part of the DOI.");
        assert(ref.url == "https://example.org/paper");
        assert(ref.isbn.empty());
        assert(ref.referenceType == ReferenceType::Journal);
    }

    {
        ExtractedReference ref;
        enricher.enrich(ref, "Author, A. (2001). Book title. Big Press. ISBN: 978-3-16-148410-0");
        assert(ref.isbn == "978-3-16-148410-0");
        assert(ref.referenceType == ReferenceType::Book);
    }

    // Enrichment never clears fields it cannot find
    {
        ExtractedReference ref;
        ref.doi = "10.9999/kept";
        ref.title = "Kept title";
        enricher.enrich(ref, "Plain text without identifiers");
        assert(ref.doi == "10.9999/kept");
        assert(ref.title == "Kept title");
        assert(ref.referenceType == ReferenceType::Unknown);
    }

    // A very long token after the scheme is cut off instead of exhausting the stack
    {
        ExtractedReference ref;
        const std::string text = "Smith, J. A. (2023). Title here. Venue, 1. https://example.org/" + std::string(50000, 'a');
        enricher.enrich(ref, text);
        assert(ref.url.rfind("https://example.org/aaa", 0) == 0);
        assert(ref.url.size() == std::string("https://").size() + 2048);
        assert(ref.referenceType == ReferenceType::Website);
    }

    // Type keywords, in priority order
    assert(MetadataEnricher::ClassifyType("Proceedings of the ACM Conference on Things") == ReferenceType::Conference);
    assert(MetadataEnricher::ClassifyType("Online resource at https://site.org/x") == ReferenceType::Website);
    assert(MetadataEnricher::ClassifyType("Doe, J. (2015). Learning things. PhD thesis, University.") == ReferenceType::Thesis);
    assert(MetadataEnricher::ClassifyType("Journal of Proceedings") == ReferenceType::Journal);
    assert(MetadataEnricher::ClassifyType("Conference book") == ReferenceType::Conference);

    std::cout << "[PASS] MetadataEnricher Test Complete." << std::endl;
    return 0;
}
