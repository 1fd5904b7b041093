#include "chronicle/ingest/SaveDiscovery.hh"

#include "chronicle/core/Log.hh"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <tuple>

namespace chronicle {

namespace {

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

SaveDiscovery::SaveDiscovery(std::filesystem::path root, DiscoveryOptions options)
    : root_(std::move(root)), options_(std::move(options)) {
    options_.saveNameFilter = lowercase(options_.saveNameFilter);
}

bool SaveDiscovery::acceptsName(const std::filesystem::path& path) const {
    if (options_.saveNameFilter.empty()) {
        return true;
    }
    return lowercase(path.stem().string()).find(options_.saveNameFilter) != std::string::npos;
}

std::vector<SaveFile> SaveDiscovery::listCandidates() const {
    std::vector<SaveFile> files;
    std::error_code ec;
    for (const auto& seriesDir : std::filesystem::directory_iterator(root_, ec)) {
        if (!seriesDir.is_directory(ec)) {
            continue;
        }
        std::string series = seriesDir.path().filename().string();
        if (series.rfind(options_.seriesPrefix, 0) != 0) {
            continue;
        }
        std::error_code inner;
        for (const auto& entry : std::filesystem::directory_iterator(seriesDir.path(), inner)) {
            if (!entry.is_regular_file(inner) || entry.path().extension() != ".sav") {
                continue;
            }
            auto modified = entry.last_write_time(inner);
            if (inner) {
                CHRONICLE_LOG_WARN("Cannot stat {}: {}", entry.path().string(), inner.message());
                inner.clear();
                continue;
            }
            files.push_back({series, entry.path(), modified});
        }
        if (inner) {
            CHRONICLE_LOG_WARN("Cannot list {}: {}", seriesDir.path().string(), inner.message());
        }
    }
    if (ec) {
        CHRONICLE_LOG_WARN("Cannot list save directory {}: {}", root_.string(), ec.message());
    }

    std::sort(files.begin(), files.end(), [](const SaveFile& a, const SaveFile& b) {
        return std::tie(a.series, a.modified, a.path) < std::tie(b.series, b.modified, b.path);
    });
    return files;
}

std::vector<SaveFile> SaveDiscovery::scan() {
    std::vector<SaveFile> fresh;
    for (auto& file : listCandidates()) {
        auto it = seen_.find(file.path);
        if (it != seen_.end() && it->second == file.modified) {
            continue;
        }
        fresh.push_back(std::move(file));
    }

    size_t unfiltered = fresh.size();
    std::vector<SaveFile> accepted;
    for (auto& file : fresh) {
        seen_[file.path] = file.modified;
        if (!acceptsName(file.path)) {
            continue;
        }
        size_t count = ++encountered_[file.series];
        if (options_.skipSaves > 0 && count % static_cast<size_t>(options_.skipSaves + 1) != 0) {
            continue;
        }
        accepted.push_back(std::move(file));
    }

    if (unfiltered > 0) {
        CHRONICLE_LOG_INFO("Found {} new save files, {} accepted", unfiltered, accepted.size());
    }
    return accepted;
}

void SaveDiscovery::markExistingProcessed() {
    for (const auto& file : listCandidates()) {
        seen_[file.path] = file.modified;
    }
}

} // namespace chronicle
