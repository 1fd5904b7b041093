#pragma once

#include <map>
#include <string>
#include <vector>

namespace chronicle {

/**
 * @brief Minimal command line parser for the chronicle executable.
 *
 * Options are registered up front as flags or value options. Values are
 * given as `--name value` or `--name=value`; anything not starting with
 * "--" is a positional argument. Unknown options and value options without
 * a value make parse() return false with a message in getErrorMessage().
 */
class ArgumentParser {
  public:
    void addArgument(const std::string& name, const std::string& description, bool takesValue = false);

    bool parse(int argc, char* argv[]);
    bool parse(const std::vector<std::string>& args);

    bool hasArgument(const std::string& name) const;
    std::string getArgument(const std::string& name, const std::string& fallback = "") const;
    const std::vector<std::string>& positionals() const { return positionals_; }

    const std::string& getErrorMessage() const { return errorMessage_; }

    // One "  --name <value>  description" line per registered option.
    std::string optionsHelp() const;

  private:
    struct Option {
        std::string description;
        bool takesValue = false;
    };

    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positionals_;
    std::string errorMessage_;
};

} // namespace chronicle
