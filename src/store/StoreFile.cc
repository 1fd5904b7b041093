#include "chronicle/store/StoreFile.hh"

#include "chronicle/core/Log.hh"
#include "chronicle/utils/ErrorHandling.hh"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace chronicle {

static constexpr const char* kStoreFormat = "chronicle-series/1";
static constexpr const char* kStoreExtension = ".json";

StoreFile::StoreFile(const std::string& directory) : directory_(directory) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        CHRONICLE_STORE_LOG_WARN("Failed to create store directory {}: {}", directory_, ec.message());
    }
}

bool StoreFile::save(const MemoryStore& store, const std::string& seriesName) const {
    auto id = store.findSeries(seriesName);
    if (!id) {
        CHRONICLE_STORE_LOG_WARN("Cannot save unknown series '{}'", seriesName);
        return false;
    }

    nlohmann::json envelope;
    try {
        envelope["format"] = kStoreFormat;
        envelope["series"] = seriesName;
        envelope["saved_at"] = currentTimestamp();
        envelope["data"] = store.exportSeries(*id);
    } catch (const StoreError& e) {
        CHRONICLE_STORE_LOG_WARN("Failed to export series '{}': {}", seriesName, e.what());
        return false;
    }

    // Write beside the target and rename, so a crash never leaves half a file.
    std::string path = pathFor(seriesName);
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file.is_open()) {
            CHRONICLE_STORE_LOG_WARN("Cannot open {} for writing", tmpPath);
            return false;
        }
        file << envelope.dump();
        if (!file.good()) {
            CHRONICLE_STORE_LOG_WARN("Failed writing {}", tmpPath);
            return false;
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmpPath, path, ec);
    if (ec) {
        CHRONICLE_STORE_LOG_WARN("Failed to move {} into place: {}", tmpPath, ec.message());
        return false;
    }

    CHRONICLE_STORE_LOG_INFO("Saved series '{}' to {}", seriesName, path);
    return true;
}

bool StoreFile::load(MemoryStore& store, const std::string& seriesName) const {
    return loadFile(store, pathFor(seriesName));
}

size_t StoreFile::loadAll(MemoryStore& store) const {
    size_t loaded = 0;
    std::error_code ec;
    if (!std::filesystem::is_directory(directory_, ec)) {
        return loaded;
    }
    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == kStoreExtension) {
            if (loadFile(store, entry.path().string())) {
                ++loaded;
            }
        }
    }
    return loaded;
}

bool StoreFile::loadFile(MemoryStore& store, const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        CHRONICLE_STORE_LOG_WARN("Series file {} not found", path);
        return false;
    }

    nlohmann::json envelope;
    try {
        file >> envelope;
    } catch (const nlohmann::json::exception& e) {
        CHRONICLE_STORE_LOG_WARN("Series file {} is not valid JSON: {}", path, e.what());
        return false;
    }

    std::string format = envelope.value("format", "");
    if (format != kStoreFormat) {
        CHRONICLE_STORE_LOG_WARN("Series file {} has format '{}', expected '{}'", path, format, kStoreFormat);
        return false;
    }
    if (!envelope.contains("data")) {
        CHRONICLE_STORE_LOG_WARN("Series file {} has no data", path);
        return false;
    }

    try {
        SeriesId id = store.importSeries(envelope["data"]);
        CHRONICLE_STORE_LOG_INFO("Loaded series '{}' (id {}) from {}", envelope.value("series", ""), id, path);
    } catch (const StoreError& e) {
        CHRONICLE_STORE_LOG_WARN("Failed to import {}: {}", path, e.what());
        return false;
    }
    return true;
}

std::vector<SeriesFileInfo> StoreFile::list() const {
    std::vector<SeriesFileInfo> files;
    std::error_code ec;

    if (!std::filesystem::is_directory(directory_, ec)) {
        return files;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory_, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != kStoreExtension) {
            continue;
        }

        try {
            std::ifstream file(entry.path());
            if (!file.is_open()) {
                continue;
            }

            nlohmann::json envelope;
            file >> envelope;

            SeriesFileInfo info;
            info.series = envelope.value("series", entry.path().stem().string());
            info.savedAt = envelope.value("saved_at", "");
            info.format = envelope.value("format", "");
            info.sizeBytes = static_cast<size_t>(entry.file_size());
            files.push_back(std::move(info));
        } catch (const std::exception& e) {
            CHRONICLE_STORE_LOG_WARN("Skipping unreadable series file {}: {}", entry.path().string(), e.what());
        }
    }

    return files;
}

bool StoreFile::remove(const std::string& seriesName) const {
    std::error_code ec;
    bool removed = std::filesystem::remove(pathFor(seriesName), ec);
    if (!removed) {
        CHRONICLE_STORE_LOG_WARN("Failed to delete series file for '{}'", seriesName);
    }
    return removed;
}

std::string StoreFile::pathFor(const std::string& seriesName) const {
    std::string stem;
    stem.reserve(seriesName.size());
    for (char c : seriesName) {
        bool safe = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' ||
                    c == '_' || c == '.';
        stem.push_back(safe ? c : '_');
    }
    return (std::filesystem::path(directory_) / (stem + kStoreExtension)).string();
}

std::string StoreFile::currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace chronicle
