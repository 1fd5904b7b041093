#include "chronicle/parser/ArgumentParser.hh"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace chronicle {

void ArgumentParser::addArgument(const std::string& name, const std::string& description, bool takesValue) {
    if (options_.find(name) == options_.end()) {
        order_.push_back(name);
    }
    options_[name] = Option{description, takesValue};
}

bool ArgumentParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

bool ArgumentParser::parse(const std::vector<std::string>& args) {
    values_.clear();
    positionals_.clear();
    errorMessage_.clear();

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg.rfind("--", 0) != 0 || arg == "--") {
            positionals_.push_back(arg);
            continue;
        }

        std::string name = arg;
        std::string value;
        bool inlineValue = false;
        if (auto eq = arg.find('='); eq != std::string::npos) {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
            inlineValue = true;
        }

        auto it = options_.find(name);
        if (it == options_.end()) {
            errorMessage_ = "Unknown option: " + name;
            return false;
        }
        if (!it->second.takesValue) {
            if (inlineValue) {
                errorMessage_ = "Option " + name + " does not take a value";
                return false;
            }
            values_[name] = "";
            continue;
        }
        if (!inlineValue) {
            if (i + 1 >= args.size()) {
                errorMessage_ = "Option " + name + " requires a value";
                return false;
            }
            value = args[++i];
        }
        values_[name] = value;
    }
    return true;
}

bool ArgumentParser::hasArgument(const std::string& name) const {
    return values_.find(name) != values_.end();
}

std::string ArgumentParser::getArgument(const std::string& name, const std::string& fallback) const {
    auto it = values_.find(name);
    return it != values_.end() ? it->second : fallback;
}

std::string ArgumentParser::optionsHelp() const {
    size_t width = 0;
    for (const auto& name : order_) {
        width = std::max(width, name.size() + (options_.at(name).takesValue ? 8 : 0));
    }

    std::ostringstream oss;
    for (const auto& name : order_) {
        const Option& option = options_.at(name);
        std::string label = option.takesValue ? name + " <value>" : name;
        oss << "  " << std::left << std::setw(static_cast<int>(width) + 2) << label << option.description << "\n";
    }
    return oss.str();
}

} // namespace chronicle
