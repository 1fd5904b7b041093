#include "chronicle/core/Config.hh"

#include "chronicle/core/Log.hh"

#include <sstream>

namespace chronicle {

namespace {

const toml::node* resolve(const toml::table& table, std::string_view dottedKey) {
    const toml::node* current = &table;
    std::string_view remaining = dottedKey;

    while (!remaining.empty()) {
        auto dot = remaining.find('.');
        std::string_view segment = (dot == std::string_view::npos) ? remaining : remaining.substr(0, dot);

        if (!current->is_table()) {
            return nullptr;
        }
        current = current->as_table()->get(segment);
        if (!current) {
            return nullptr;
        }

        if (dot == std::string_view::npos) {
            break;
        }
        remaining = remaining.substr(dot + 1);
    }
    return current;
}

std::string keyError(std::string_view key, std::string_view problem) {
    std::ostringstream oss;
    oss << "key '" << key << "' " << problem;
    return oss.str();
}

// Copies an optional key into `target`. Only a present value of the wrong
// type is an error.
template <typename T, typename Getter>
Result<void> readOptional(const toml::table& table, std::string_view key, Getter getter, T& target) {
    auto value = getter(table, key);
    if (value.isOk()) {
        target = static_cast<T>(value.value());
        return Result<void>::ok();
    }
    if (value.code() == ErrorCode::NotFound) {
        return Result<void>::ok();
    }
    return Result<void>::error(value);
}

Result<Config> fromTable(const toml::table& table, std::string_view sourceName) {
    Config config;
    Result<void> steps[] = {
        readOptional(table, "import.threads", getInt, config.threads),
        readOptional(table, "import.save_name_filter", getString, config.saveNameFilter),
        readOptional(table, "import.skip_saves", getInt, config.skipSaves),
        readOptional(table, "import.max_nesting_depth", getInt, config.maxNestingDepth),
        readOptional(table, "import.save_dir", getString, config.saveDir),
        readOptional(table, "timeline.observer_name", getString, config.observerName),
        readOptional(table, "timeline.read_all_countries", getBool, config.readAllCountries),
        readOptional(table, "store.dir", getString, config.storeDir),
        readOptional(table, "log.level", getString, config.logLevel),
        readOptional(table, "log.file", getString, config.logFile),
    };
    for (auto& step : steps) {
        if (step.isError()) {
            return Result<Config>::error(step, sourceName);
        }
    }

    auto valid = config.validate();
    if (valid.isError()) {
        return Result<Config>::error(valid, sourceName);
    }
    return Result<Config>::ok(std::move(config));
}

} // namespace

Result<std::string> getString(const toml::table& table, std::string_view dottedKey) {
    const auto* node = resolve(table, dottedKey);
    if (!node) {
        return Result<std::string>::error(ErrorCode::NotFound, keyError(dottedKey, "not found"));
    }
    if (auto val = node->as_string()) {
        return Result<std::string>::ok(std::string(val->get()));
    }
    return Result<std::string>::error(ErrorCode::TypeMismatch, keyError(dottedKey, "is not a string"));
}

Result<std::int64_t> getInt(const toml::table& table, std::string_view dottedKey) {
    const auto* node = resolve(table, dottedKey);
    if (!node) {
        return Result<std::int64_t>::error(ErrorCode::NotFound, keyError(dottedKey, "not found"));
    }
    if (auto val = node->as_integer()) {
        return Result<std::int64_t>::ok(val->get());
    }
    return Result<std::int64_t>::error(ErrorCode::TypeMismatch, keyError(dottedKey, "is not an integer"));
}

Result<bool> getBool(const toml::table& table, std::string_view dottedKey) {
    const auto* node = resolve(table, dottedKey);
    if (!node) {
        return Result<bool>::error(ErrorCode::NotFound, keyError(dottedKey, "not found"));
    }
    if (auto val = node->as_boolean()) {
        return Result<bool>::ok(val->get());
    }
    return Result<bool>::error(ErrorCode::TypeMismatch, keyError(dottedKey, "is not a boolean"));
}

Result<Config> Config::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Result<Config>::error(ErrorCode::NotFound, "Config file not found: " + path.string());
    }

    try {
        auto table = toml::parse_file(path.string());
        CHRONICLE_LOG_DEBUG("Loaded config: {}", path.string());
        return fromTable(table, path.string());
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << path.string() << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<Config>::error(ErrorCode::ParseFailure, oss.str());
    }
}

Result<Config> Config::parse(std::string_view tomlContent, std::string_view sourceName) {
    try {
        auto table = toml::parse(tomlContent, sourceName);
        return fromTable(table, sourceName);
    } catch (const toml::parse_error& err) {
        std::ostringstream oss;
        oss << sourceName << ":" << err.source().begin.line << ":" << err.source().begin.column << " - "
            << err.description();
        return Result<Config>::error(ErrorCode::ParseFailure, oss.str());
    }
}

Result<void> Config::validate() const {
    if (threads < 1) {
        return Result<void>::error(ErrorCode::OutOfRange, keyError("import.threads", "must be at least 1"));
    }
    if (skipSaves < 0) {
        return Result<void>::error(ErrorCode::OutOfRange, keyError("import.skip_saves", "must not be negative"));
    }
    if (maxNestingDepth < 8) {
        return Result<void>::error(ErrorCode::OutOfRange, keyError("import.max_nesting_depth", "must be at least 8"));
    }
    if (!log::levelFromString(logLevel)) {
        return Result<void>::error(ErrorCode::InvalidState,
                                   keyError("log.level", "is not a log level: '" + logLevel + "'"));
    }
    return Result<void>::ok();
}

} // namespace chronicle
