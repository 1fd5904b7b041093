#pragma once

#include "chronicle/store/MemoryStore.hh"

#include <string>
#include <vector>

namespace chronicle {

/// Metadata for a series file on disk
struct SeriesFileInfo {
    std::string series;
    std::string savedAt;
    std::string format;
    size_t sizeBytes = 0;
};

/// Persists MemoryStore series as JSON documents, one file per series.
/// Each file wraps the exported series in a metadata envelope
/// (format version, series name, timestamp).
class StoreFile {
  public:
    explicit StoreFile(const std::string& directory);

    /// Write the committed state of a series to <directory>/<series>.json.
    bool save(const MemoryStore& store, const std::string& seriesName) const;

    /// Replace the named series in the store with the file contents.
    /// Validates the format version before importing.
    bool load(MemoryStore& store, const std::string& seriesName) const;

    /// Load every series file in the directory. Returns the number loaded.
    size_t loadAll(MemoryStore& store) const;

    /// Scan the directory and return metadata for each series file found.
    std::vector<SeriesFileInfo> list() const;

    bool remove(const std::string& seriesName) const;

    std::string pathFor(const std::string& seriesName) const;

  private:
    bool loadFile(MemoryStore& store, const std::string& path) const;
    static std::string currentTimestamp();

    std::string directory_;
};

} // namespace chronicle
