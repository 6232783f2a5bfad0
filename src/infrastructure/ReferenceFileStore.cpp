/**
 * @file ReferenceFileStore.cpp
 * @brief Implementation of ReferenceFileStore.
 */

#include "infrastructure/ReferenceFileStore.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace citewalker::infrastructure {

namespace fs = std::filesystem;

namespace {

void RemoveTemp(const fs::path& tempPath) {
    std::error_code ec;
    fs::remove(tempPath, ec);
    if (ec) {
        std::cerr << "[Storage] Could not remove temp file " << tempPath << ": " << ec.message() << std::endl;
    }
}

} // namespace

std::optional<std::string> ReferenceFileStore::WriteAtomic(const std::string& path, const std::string& content) {
    static std::atomic<unsigned> sequence{0};
    fs::path finalPath = path;

    // Unique temp path: filename.<timestamp>.<seq>.tmp
    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + "." + std::to_string(sequence++) + ".tmp";

    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[Storage] Error creating directories: " << ec.message() << std::endl;
            return "Could not create directory " + finalPath.parent_path().string() + ": " + ec.message();
        }
    }

    {
        std::ofstream ofs(tempPath, std::ios::binary);
        if (!ofs.is_open()) {
            std::cerr << "[Storage] Failed to open temp file: " << tempPath << std::endl;
            return "Could not open " + tempPath.string() + " for writing";
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[Storage] Write failed: " << tempPath << std::endl;
            ofs.close();
            RemoveTemp(tempPath);
            return "Write failed for " + finalPath.string();
        }
    }

    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[Storage] Rename failed: " << ec.message() << std::endl;
        RemoveTemp(tempPath);
        return "Could not move report into place at " + finalPath.string() + ": " + ec.message();
    }
    return std::nullopt;
}

} // namespace citewalker::infrastructure
