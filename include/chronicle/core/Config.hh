#pragma once

#include "chronicle/utils/ErrorHandling.hh"

#include <toml++/toml.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace chronicle {

// Runtime settings read from chronicle.toml. Every field has a default, so an
// empty document is a valid configuration.
struct Config {
    // [import]
    int threads = 1;
    std::string saveNameFilter;
    int skipSaves = 0;
    int maxNestingDepth = 256;
    std::string saveDir = "saves";

    // [timeline]
    std::string observerName;
    bool readAllCountries = false;

    // [store]
    std::string storeDir = "store";

    // [log]
    std::string logLevel = "info";
    std::string logFile;

    static Result<Config> load(const std::filesystem::path& path);
    static Result<Config> parse(std::string_view tomlContent, std::string_view sourceName = "string");

    // Rejects values the importer cannot work with.
    Result<void> validate() const;
};

// Typed lookups of dotted keys ("import.threads"). A missing key returns
// NotFound, a value of another type returns TypeMismatch.
Result<std::string> getString(const toml::table& table, std::string_view dottedKey);
Result<std::int64_t> getInt(const toml::table& table, std::string_view dottedKey);
Result<bool> getBool(const toml::table& table, std::string_view dottedKey);

} // namespace chronicle
