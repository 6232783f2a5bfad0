/**
 * @file ReferenceExtractionService.hpp
 * @brief Document-level orchestration: validate, extract text, parse, filter, export.
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "application/ReferenceParsingPipeline.hpp"
#include "application/TextExtractionArbiter.hpp"
#include "domain/TextExtractionBackend.hpp"
#include "domain/references/ExtractedReference.hpp"
#include "domain/references/ExtractionSettings.hpp"

namespace citewalker::application {

/**
 * @struct DocumentResult
 * @brief Outcome of processing one document. On error only path, error and timing are meaningful.
 */
struct DocumentResult {
    std::string status = "error";           ///< "success" or "error".
    std::string documentPath;
    std::optional<std::string> error;
    std::string methodUsed;
    float extractionQuality = 0.0f;
    size_t textLength = 0;
    size_t totalFound = 0;
    size_t filteredCount = 0;
    float averageConfidence = 0.0f;
    float confidenceThreshold = 0.0f;
    std::vector<domain::references::ExtractedReference> references;  ///< Filtered.
    std::map<std::string, std::string> outputFiles;                  ///< format -> path or "Error: ..."
    double fileSizeMb = 0.0;
    double processingSeconds = 0.0;

    bool ok() const { return status == "success"; }
};

/**
 * @struct BatchResult
 * @brief Per-document results plus the aggregate written to batch_summary.json.
 */
struct BatchResult {
    size_t totalFiles = 0;
    size_t successfulExtractions = 0;
    size_t failedExtractions = 0;
    size_t totalReferencesExtracted = 0;
    std::string outputDirectory;
    std::string processingTimestamp;
    std::vector<DocumentResult> documents;  ///< Same order as the input paths.
    std::string summaryFile;                ///< Empty if the summary could not be written.
};

/**
 * @struct ProcessingError
 * @brief A failed document recorded in the statistics.
 */
struct ProcessingError {
    std::string documentPath;
    std::string error;
    std::string timestamp;
};

/**
 * @struct ProcessingStatistics
 * @brief Counters accumulated across processDocument calls.
 */
struct ProcessingStatistics {
    size_t documentsProcessed = 0;
    size_t referencesExtracted = 0;
    float averageConfidence = 0.0f;     ///< Mean over every exported reference.
    std::vector<ProcessingError> processingErrors;
};

/**
 * @class ReferenceExtractionService
 * @brief Orchestrates the arbiter, the parsing pipeline and report export.
 *
 * Documents share no mutable state apart from the statistics, which are
 * guarded by a mutex, so batches can run documents in parallel.
 */
class ReferenceExtractionService {
public:
    ReferenceExtractionService(domain::references::ExtractionSettings settings,
                               std::vector<std::shared_ptr<domain::TextExtractionBackend>> backends);

    /**
     * @brief Full pipeline on raw text.
     * @throws domain::references::MalformedInputError for empty or blank text.
     */
    std::vector<domain::references::ExtractedReference> extractReferences(const std::string& rawText) const;

    static std::vector<domain::references::ExtractedReference> FilterByConfidence(
        const std::vector<domain::references::ExtractedReference>& references, float threshold);

    /**
     * @brief Processes one document end to end.
     * @param outputBase Path without extension; defaults to "extracted_references_<stem>".
     * @param formats Export formats; defaults to the configured output formats.
     * @return Never throws; failures are reported through status and error.
     */
    DocumentResult processDocument(const std::string& documentPath,
                                   const std::optional<std::string>& outputBase = std::nullopt,
                                   const std::optional<std::vector<std::string>>& formats = std::nullopt,
                                   std::function<void(std::string)> statusCallback = nullptr);

    /**
     * @brief Processes several documents into outputDir and writes batch_summary.json there.
     */
    BatchResult processBatch(const std::vector<std::string>& documentPaths,
                             const std::string& outputDir = "batch_extraction",
                             std::function<void(std::string)> statusCallback = nullptr);

    /** @brief Renders the batch summary document. */
    static nlohmann::json BatchSummaryToJson(const BatchResult& batch);

    ProcessingStatistics getStatistics() const;
    void resetStatistics();

    const domain::references::ExtractionSettings& settings() const { return m_settings; }

private:
    domain::references::ExtractionSettings m_settings;
    TextExtractionArbiter m_arbiter;
    ReferenceParsingPipeline m_pipeline;

    mutable std::mutex m_statsMutex;
    ProcessingStatistics m_stats;
    double m_confidenceSum = 0.0;

    std::map<std::string, std::string> exportReferences(
        const std::vector<domain::references::ExtractedReference>& references,
        const std::string& outputBase,
        const std::vector<std::string>& formats) const;

    void recordSuccess(const std::vector<domain::references::ExtractedReference>& references);
    void recordFailure(const std::string& documentPath, const std::string& error);
};

} // namespace citewalker::application
