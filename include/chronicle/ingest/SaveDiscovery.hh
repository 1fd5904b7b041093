#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace chronicle {

// One save file, named by the series directory it lives in.
struct SaveFile {
    std::string series;
    std::filesystem::path path;
    std::filesystem::file_time_type modified;
};

struct DiscoveryOptions {
    // Case-insensitive substring of the file name; empty accepts all.
    std::string saveNameFilter;
    // Keep every (skipSaves + 1)-th new save of a series.
    int skipSaves = 0;
    // Only series directories whose name starts with this prefix.
    std::string seriesPrefix;
};

/**
 * @brief Finds new save files below <root>/<series>/.
 *
 * scan() returns the files that were not returned before, or whose
 * modification time changed since, ordered by series, then modification
 * time, then file name. Files dropped by skipSaves count as seen.
 */
class SaveDiscovery {
  public:
    explicit SaveDiscovery(std::filesystem::path root, DiscoveryOptions options = {});

    std::vector<SaveFile> scan();

    // Treat everything currently on disk as already imported.
    void markExistingProcessed();

    size_t seenCount() const { return seen_.size(); }
    const std::filesystem::path& root() const { return root_; }

  private:
    std::vector<SaveFile> listCandidates() const;
    bool acceptsName(const std::filesystem::path& path) const;

    std::filesystem::path root_;
    DiscoveryOptions options_;
    std::map<std::filesystem::path, std::filesystem::file_time_type> seen_;
    std::map<std::string, size_t> encountered_;
};

} // namespace chronicle
