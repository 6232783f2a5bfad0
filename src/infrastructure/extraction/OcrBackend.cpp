/**
 * @file OcrBackend.cpp
 * @brief Implementation of OcrBackend.
 */

#include "infrastructure/extraction/OcrBackend.hpp"
#include "infrastructure/extraction/PdfToTextBackend.hpp"
#include "infrastructure/CommandRunner.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace citewalker::infrastructure::extraction {

using domain::references::PageText;
using domain::references::RawExtraction;

namespace {

fs::path MakeTempPath(const std::string& suffix) {
    static std::atomic<unsigned> counter{0};
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    std::string name = "citewalker_" + std::to_string(now) + "_" + std::to_string(counter++) + suffix;
    return fs::temp_directory_path() / name;
}

bool IsImageExtension(const std::string& ext) {
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg" || ext == ".tif" || ext == ".tiff" || ext == ".bmp";
}

void RemoveQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        std::cerr << "[OcrBackend] Could not remove temp path " << path << ": " << ec.message() << std::endl;
    }
}

} // namespace

OcrBackend::OcrBackend(std::string language, std::function<void(std::string)> statusCallback)
    : m_language(std::move(language)), m_statusCallback(std::move(statusCallback)) {}

void OcrBackend::report(const std::string& message) const {
    if (m_statusCallback) m_statusCallback(message);
}

RawExtraction OcrBackend::extract(const std::string& documentPath) {
    const std::string ext = LowerExtension(documentPath);
    RawExtraction result;

    if (IsImageExtension(ext)) {
        result = extractImage(documentPath);
    } else if (ext != ".pdf") {
        result.error = "OCR supports PDF and image documents only.";
    } else if (CommandRunner::HasTool("ocrmypdf")) {
        result = extractWithOcrmypdf(documentPath);
        if (!result.success && CommandRunner::HasTool("tesseract")) {
            result = extractWithTesseractPages(documentPath);
        }
    } else if (CommandRunner::HasTool("tesseract") && CommandRunner::HasTool("pdftoppm")) {
        result = extractWithTesseractPages(documentPath);
    } else {
        result.error = "No OCR tool available (install ocrmypdf or tesseract).";
    }

    result.method = name();
    result.isOcr = true;
    return result;
}

RawExtraction OcrBackend::extractWithOcrmypdf(const std::string& pdfPath) {
    report("[OCR] Running ocrmypdf on " + fs::path(pdfPath).filename().string() + "...");
    const fs::path ocrPdf = MakeTempPath(".pdf");

    std::string cmd = "ocrmypdf --skip-text -l " + CommandRunner::Quote(m_language) + " --output-type pdf " +
                      CommandRunner::Quote(pdfPath) + " " + CommandRunner::Quote(ocrPdf.string()) + " 2>&1";
    bool ok = CommandRunner::RunWithCallback(cmd, [this](const std::string& line) {
        if (line.find("Page") != std::string::npos || line.find("[Error]") != std::string::npos) {
            report("[OCR] " + line);
        }
    });

    RawExtraction result;
    if (ok) {
        result = PdfToTextBackend::RunPdfToText(ocrPdf.string(), "");
    } else {
        result.error = "ocrmypdf failed to process the file.";
    }
    RemoveQuietly(ocrPdf);
    return result;
}

RawExtraction OcrBackend::extractWithTesseractPages(const std::string& pdfPath) {
    report("[OCR] Rasterizing pages for tesseract...");
    RawExtraction result;

    const fs::path workDir = MakeTempPath("_pages");
    std::error_code ec;
    fs::create_directories(workDir, ec);
    if (ec) {
        result.error = "Could not create OCR work directory: " + ec.message();
        return result;
    }

    const std::string prefix = (workDir / "page").string();
    auto raster = CommandRunner::Run("pdftoppm -r 300 -png " + CommandRunner::Quote(pdfPath) + " " +
                                     CommandRunner::Quote(prefix) + " 2>/dev/null");
    if (!raster.ok()) {
        result.error = "pdftoppm failed to rasterize the document.";
        RemoveQuietly(workDir);
        return result;
    }

    std::vector<fs::path> images;
    for (const auto& entry : fs::directory_iterator(workDir)) {
        if (entry.is_regular_file() && entry.path().extension() == ".png") images.push_back(entry.path());
    }
    // pdftoppm zero-pads page numbers, so lexical order is page order.
    std::sort(images.begin(), images.end());

    std::string joined;
    int pageNumber = 0;
    for (const auto& image : images) {
        ++pageNumber;
        bool ok = false;
        std::string pageText = runTesseract(image.string(), ok);
        if (!ok) {
            std::cerr << "[OcrBackend] tesseract failed on page " << pageNumber << std::endl;
            continue;
        }
        if (pageText.find_first_not_of(" \t\r\n\f\v") == std::string::npos) continue;
        if (!joined.empty()) joined += "\n";
        joined += pageText;
        result.pages.push_back(PageText{pageNumber, pageText, pageText.size()});
    }
    RemoveQuietly(workDir);

    if (result.pages.empty()) {
        result.error = "tesseract produced no text.";
        return result;
    }
    result.text = std::move(joined);
    result.success = true;
    return result;
}

RawExtraction OcrBackend::extractImage(const std::string& imagePath) {
    RawExtraction result;
    if (!CommandRunner::HasTool("tesseract")) {
        result.error = "tesseract not found.";
        return result;
    }
    bool ok = false;
    std::string text = runTesseract(imagePath, ok);
    if (!ok) {
        result.error = "tesseract failed on image.";
        return result;
    }
    result.pages.push_back(PageText{1, text, text.size()});
    result.text = std::move(text);
    result.success = true;
    return result;
}

std::string OcrBackend::runTesseract(const std::string& imagePath, bool& ok) {
    auto run = CommandRunner::Run("tesseract " + CommandRunner::Quote(imagePath) + " stdout -l " +
                                  CommandRunner::Quote(m_language) + " 2>/dev/null");
    ok = run.ok();
    return run.output;
}

} // namespace citewalker::infrastructure::extraction
