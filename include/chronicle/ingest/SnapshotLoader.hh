#pragma once

#include "chronicle/parser/Parser.hh"
#include "chronicle/parser/Value.hh"
#include "chronicle/utils/ErrorHandling.hh"

#include <filesystem>
#include <string>
#include <string_view>

namespace chronicle {

/**
 * @brief Turns a save file on disk into a value tree.
 *
 * A `.sav` file is a zip archive whose `gamestate` member holds the text
 * format (stored or deflated). Any file that does not start with a zip local
 * header is read as plain gamestate text. `#` comments are stripped before
 * tokenizing.
 *
 * I/O and archive problems come back as IoFailure / ParseFailure results;
 * grammar violations as ParseFailure with the FormatError line in the
 * message. Safe to call from several threads at once.
 */
class SnapshotLoader {
  public:
    static constexpr std::string_view kGamestateMember = "gamestate";

    explicit SnapshotLoader(ParserOptions options = {}) : options_(options) {}

    // Decoded, comment-free gamestate text.
    static Result<std::string> readText(const std::filesystem::path& path);

    // Extracts one member from an in-memory zip archive.
    static Result<std::string> extractMember(std::string_view archive, std::string_view member);

    Result<Value> load(const std::filesystem::path& path) const;

    const ParserOptions& options() const { return options_; }

  private:
    ParserOptions options_;
};

} // namespace chronicle
