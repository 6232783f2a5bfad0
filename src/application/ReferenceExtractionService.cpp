/**
 * @file ReferenceExtractionService.cpp
 * @brief Implementation of ReferenceExtractionService.
 */

#include "application/ReferenceExtractionService.hpp"
#include "application/ReferenceExportService.hpp"
#include "infrastructure/ReferenceFileStore.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace fs = std::filesystem;

namespace citewalker::application {

using domain::references::ExtractedReference;
using domain::references::ExtractionSettings;

namespace {

std::string FormatFixed(double value, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << value;
    return ss.str();
}

std::string ExtensionFor(const std::string& format) {
    return "." + format;
}

} // namespace

ReferenceExtractionService::ReferenceExtractionService(ExtractionSettings settings,
                                                       std::vector<std::shared_ptr<domain::TextExtractionBackend>> backends)
    : m_settings(std::move(settings)),
      m_arbiter(std::move(backends), m_settings.qualityIndicators),
      m_pipeline(m_settings.minReferenceLength) {}

std::vector<ExtractedReference> ReferenceExtractionService::extractReferences(const std::string& rawText) const {
    return m_pipeline.extractReferences(rawText);
}

std::vector<ExtractedReference> ReferenceExtractionService::FilterByConfidence(
    const std::vector<ExtractedReference>& references, float threshold) {
    return ReferenceParsingPipeline::FilterByConfidence(references, threshold);
}

DocumentResult ReferenceExtractionService::processDocument(const std::string& documentPath,
                                                           const std::optional<std::string>& outputBase,
                                                           const std::optional<std::vector<std::string>>& formats,
                                                           std::function<void(std::string)> statusCallback) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]() {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    DocumentResult result;
    result.documentPath = documentPath;
    result.confidenceThreshold = m_settings.minConfidenceThreshold;

    try {
        std::error_code ec;
        if (!fs::is_regular_file(documentPath, ec)) {
            throw std::runtime_error("Document not found: " + documentPath);
        }

        const auto sizeBytes = fs::file_size(documentPath, ec);
        if (ec) {
            throw std::runtime_error("Could not read file size: " + ec.message());
        }
        result.fileSizeMb = static_cast<double>(sizeBytes) / (1024.0 * 1024.0);
        if (result.fileSizeMb > m_settings.maxFileSizeMb) {
            throw std::runtime_error("File too large: " + FormatFixed(result.fileSizeMb, 1) +
                                     "MB (max: " + FormatFixed(m_settings.maxFileSizeMb, 1) + "MB)");
        }

        const std::string base = outputBase.value_or("extracted_references_" + fs::path(documentPath).stem().string());
        const std::vector<std::string> outputFormats = formats.value_or(m_settings.outputFormats);

        std::cout << "[Extraction] Processing " << documentPath << " ("
                  << FormatFixed(result.fileSizeMb, 1) << "MB)" << std::endl;
        if (statusCallback) statusCallback("Extracting text from " + fs::path(documentPath).filename().string() + "...");

        auto arbitration = m_arbiter.select(documentPath, statusCallback);
        const auto& best = arbitration.best;
        result.methodUsed = best.method;
        result.extractionQuality = best.qualityScore;
        result.textLength = best.text.size();
        std::cout << "[Extraction] Text extracted with " << best.method
                  << " (quality " << FormatFixed(best.qualityScore, 2) << ", "
                  << best.text.size() << " characters)" << std::endl;

        if (statusCallback) statusCallback("Parsing references...");
        const auto references = m_pipeline.extractReferences(best.text);
        if (references.empty()) {
            throw std::runtime_error("No reference candidates found in document.");
        }

        auto filtered = FilterByConfidence(references, m_settings.minConfidenceThreshold);
        result.totalFound = references.size();
        result.filteredCount = filtered.size();
        if (!filtered.empty()) {
            double sum = 0.0;
            for (const auto& reference : filtered) sum += reference.confidenceScore;
            result.averageConfidence = static_cast<float>(sum / static_cast<double>(filtered.size()));
        }
        std::cout << "[Extraction] Found " << result.totalFound << " references, "
                  << result.filteredCount << " above threshold " << FormatFixed(result.confidenceThreshold, 2)
                  << std::endl;

        if (statusCallback) statusCallback("Writing reports...");
        result.outputFiles = exportReferences(filtered, base, outputFormats);

        recordSuccess(filtered);
        result.references = std::move(filtered);
        result.status = "success";
        result.processingSeconds = elapsed();
        std::cout << "[Extraction] Completed " << documentPath << " in "
                  << FormatFixed(result.processingSeconds, 2) << "s" << std::endl;
    } catch (const std::exception& e) {
        result.status = "error";
        result.error = e.what();
        result.processingSeconds = elapsed();
        std::cerr << "[Extraction] Error processing " << documentPath << ": " << e.what() << std::endl;
        recordFailure(documentPath, e.what());
    }

    return result;
}

std::map<std::string, std::string> ReferenceExtractionService::exportReferences(
    const std::vector<ExtractedReference>& references,
    const std::string& outputBase,
    const std::vector<std::string>& formats) const {
    std::map<std::string, std::string> outputFiles;
    const std::string timestamp = ReferenceExportService::CurrentTimestamp();

    for (const auto& format : formats) {
        auto content = ReferenceExportService::Render(format, references, timestamp);
        if (!content) {
            std::cerr << "[Storage] Unsupported output format: " << format << std::endl;
            outputFiles[format] = "Error: unsupported format";
            continue;
        }

        const std::string path = outputBase + ExtensionFor(format);
        if (auto error = infrastructure::ReferenceFileStore::WriteAtomic(path, *content)) {
            outputFiles[format] = "Error: " + *error;
        } else {
            outputFiles[format] = path;
        }
    }
    return outputFiles;
}

BatchResult ReferenceExtractionService::processBatch(const std::vector<std::string>& documentPaths,
                                                     const std::string& outputDir,
                                                     std::function<void(std::string)> statusCallback) {
    BatchResult batch;
    batch.totalFiles = documentPaths.size();
    batch.outputDirectory = outputDir;
    batch.documents.resize(documentPaths.size());

    std::error_code ec;
    fs::create_directories(outputDir, ec);
    if (ec) {
        std::cerr << "[Batch] Could not create output directory " << outputDir << ": " << ec.message() << std::endl;
    }

    // Distinct output bases even when two inputs share a file stem.
    std::vector<std::string> outputBases;
    std::set<std::string> usedStems;
    for (const auto& path : documentPaths) {
        std::string stem = fs::path(path).stem().string();
        std::string unique = stem;
        for (int n = 2; usedStems.count(unique); ++n) unique = stem + "_" + std::to_string(n);
        usedStems.insert(unique);
        outputBases.push_back((fs::path(outputDir) / ("references_" + unique)).string());
    }

    std::cout << "[Batch] Starting extraction of " << documentPaths.size() << " documents into "
              << outputDir << std::endl;

    std::mutex callbackMutex;
    auto reportStatus = [&](const std::string& message) {
        if (!statusCallback) return;
        std::lock_guard<std::mutex> lock(callbackMutex);
        statusCallback(message);
    };

    std::atomic<size_t> nextIndex{0};
    auto worker = [&]() {
        for (size_t i = nextIndex++; i < documentPaths.size(); i = nextIndex++) {
            reportStatus("Processing file " + std::to_string(i + 1) + "/" + std::to_string(documentPaths.size()) +
                         ": " + fs::path(documentPaths[i]).filename().string());
            batch.documents[i] = processDocument(documentPaths[i], outputBases[i], std::nullopt, nullptr);
        }
    };

    const size_t workerCount = std::max<size_t>(1, std::min(m_settings.maxParallelDocuments, documentPaths.size()));
    if (workerCount == 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        for (size_t t = 0; t < workerCount; ++t) threads.emplace_back(worker);
        for (auto& thread : threads) {
            if (thread.joinable()) thread.join();
        }
    }

    for (const auto& document : batch.documents) {
        if (document.ok()) {
            ++batch.successfulExtractions;
            batch.totalReferencesExtracted += document.references.size();
        } else {
            ++batch.failedExtractions;
        }
    }
    batch.processingTimestamp = ReferenceExportService::CurrentTimestamp();

    const std::string summaryPath = (fs::path(outputDir) / "batch_summary.json").string();
    if (auto error = infrastructure::ReferenceFileStore::WriteAtomic(summaryPath, BatchSummaryToJson(batch).dump(2))) {
        std::cerr << "[Batch] Could not write summary: " << *error << std::endl;
    } else {
        batch.summaryFile = summaryPath;
    }

    std::cout << "[Batch] Complete: " << batch.successfulExtractions << " succeeded, "
              << batch.failedExtractions << " failed, " << batch.totalReferencesExtracted
              << " references extracted" << std::endl;
    return batch;
}

nlohmann::json ReferenceExtractionService::BatchSummaryToJson(const BatchResult& batch) {
    nlohmann::json individual = nlohmann::json::object();
    for (const auto& document : batch.documents) {
        // A path listed twice gets " #2", " #3", ... so no result is overwritten.
        std::string key = document.documentPath;
        for (int n = 2; individual.contains(key); ++n) key = document.documentPath + " #" + std::to_string(n);
        individual[key] = {
            {"status", document.status},
            {"references_count", document.references.size()},
            {"processing_time", document.processingSeconds},
            {"error", document.error ? nlohmann::json(*document.error) : nlohmann::json(nullptr)}
        };
    }

    return {
        {"batch_summary", {
            {"total_files", batch.totalFiles},
            {"successful_extractions", batch.successfulExtractions},
            {"failed_extractions", batch.failedExtractions},
            {"total_references_extracted", batch.totalReferencesExtracted},
            {"output_directory", batch.outputDirectory},
            {"processing_timestamp", batch.processingTimestamp}
        }},
        {"individual_results", individual}
    };
}

void ReferenceExtractionService::recordSuccess(const std::vector<ExtractedReference>& references) {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    ++m_stats.documentsProcessed;
    m_stats.referencesExtracted += references.size();
    for (const auto& reference : references) m_confidenceSum += reference.confidenceScore;
    if (m_stats.referencesExtracted > 0) {
        m_stats.averageConfidence = static_cast<float>(m_confidenceSum / static_cast<double>(m_stats.referencesExtracted));
    }
}

void ReferenceExtractionService::recordFailure(const std::string& documentPath, const std::string& error) {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats.processingErrors.push_back(ProcessingError{documentPath, error, ReferenceExportService::CurrentTimestamp()});
}

ProcessingStatistics ReferenceExtractionService::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

void ReferenceExtractionService::resetStatistics() {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_stats = ProcessingStatistics{};
    m_confidenceSum = 0.0;
}

} // namespace citewalker::application
