// EN: Command-line option parser implementation
// FR: Implémentation de l'analyseur d'options de ligne de commande

#include "tnorm/infrastructure/cli/cli_parser.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace TNORM {

namespace {

std::vector<std::string> splitList(const std::string& raw, char separator) {
    std::vector<std::string> items;
    std::string item;
    std::istringstream stream(raw);
    while (std::getline(stream, item, separator)) {
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

std::optional<bool> parseBool(const std::string& raw) {
    std::string lower = raw;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") return true;
    if (lower == "false" || lower == "0" || lower == "no" || lower == "off") return false;
    return std::nullopt;
}

} // namespace

std::string cliParseStatusToString(CliParseStatus status) {
    switch (status) {
        case CliParseStatus::SUCCESS:           return "SUCCESS";
        case CliParseStatus::HELP_REQUESTED:    return "HELP_REQUESTED";
        case CliParseStatus::VERSION_REQUESTED: return "VERSION_REQUESTED";
        case CliParseStatus::INVALID_OPTION:    return "INVALID_OPTION";
        case CliParseStatus::MISSING_VALUE:     return "MISSING_VALUE";
        case CliParseStatus::INVALID_VALUE:     return "INVALID_VALUE";
        case CliParseStatus::MISSING_REQUIRED:  return "MISSING_REQUIRED";
        default:                                return "UNKNOWN";
    }
}

std::string CliParseResult::getString(const std::string& name, const std::string& default_value) const {
    auto it = values.find(name);
    return it == values.end() ? default_value : it->second.asOrDefault<std::string>(default_value);
}

std::optional<std::string> CliParseResult::getOptionalString(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second.tryAs<std::string>();
}

bool CliParseResult::getFlag(const std::string& name, bool default_value) const {
    auto it = values.find(name);
    return it == values.end() ? default_value : it->second.asOrDefault<bool>(default_value);
}

std::optional<int> CliParseResult::getInt(const std::string& name) const {
    auto it = values.find(name);
    if (it == values.end()) {
        return std::nullopt;
    }
    return it->second.tryAs<int>();
}

std::vector<std::string> CliParseResult::getList(const std::string& name) const {
    auto it = values.find(name);
    return it == values.end() ? std::vector<std::string>{} : it->second.asStringList();
}

CliParser::CliParser(std::string program_name) : program_name_(std::move(program_name)) {}

void CliParser::addOption(const CliOptionDefinition& option_def) {
    auto it = std::find_if(options_.begin(), options_.end(),
                           [&](const CliOptionDefinition& existing) { return existing.long_name == option_def.long_name; });
    if (it != options_.end()) {
        *it = option_def;
    } else {
        options_.push_back(option_def);
    }
}

void CliParser::addOptions(const std::vector<CliOptionDefinition>& option_defs) {
    for (const auto& option_def : option_defs) {
        addOption(option_def);
    }
}

void CliParser::addStandardOptions() {
    CliOptionDefinition config_file;
    config_file.long_name = "config";
    config_file.short_name = 'c';
    config_file.description = "YAML configuration file";
    addOption(config_file);

    CliOptionDefinition log_level;
    log_level.long_name = "log-level";
    log_level.description = "Log level (debug, info, warn, error)";
    log_level.config_path = "logging.level";
    addOption(log_level);

    CliOptionDefinition log_file;
    log_file.long_name = "log-file";
    log_file.description = "NDJSON log file instead of stderr";
    log_file.config_path = "logging.file";
    addOption(log_file);

    CliOptionDefinition roots;
    roots.long_name = "roots";
    roots.type = CliOptionType::STRING_LIST;
    roots.description = "Allowed roots, ';'-separated";
    roots.config_path = "engine.allowed_roots";
    roots.list_separator = ';';
    addOption(roots);

    CliOptionDefinition presets_dir;
    presets_dir.long_name = "presets-dir";
    presets_dir.description = "Directory holding preset files";
    presets_dir.config_path = "engine.presets_dir";
    addOption(presets_dir);
}

bool CliParser::hasOption(const std::string& long_name) const {
    return findLong(long_name) != nullptr;
}

const CliOptionDefinition* CliParser::findLong(const std::string& name) const {
    for (const auto& option_def : options_) {
        if (option_def.long_name == name) {
            return &option_def;
        }
    }
    return nullptr;
}

const CliOptionDefinition* CliParser::findShort(char name) const {
    for (const auto& option_def : options_) {
        if (option_def.short_name && *option_def.short_name == name) {
            return &option_def;
        }
    }
    return nullptr;
}

std::optional<ConfigValue> CliParser::convertValue(const CliOptionDefinition& option_def, const std::string& raw,
                                                   const ConfigValue* previous, std::string& error) {
    switch (option_def.type) {
        case CliOptionType::BOOLEAN: {
            auto parsed = parseBool(raw);
            if (!parsed) {
                error = "Option --" + option_def.long_name + " expects a boolean, got: " + raw;
                return std::nullopt;
            }
            return ConfigValue(*parsed);
        }
        case CliOptionType::INTEGER: {
            try {
                std::size_t consumed = 0;
                const int parsed = std::stoi(raw, &consumed);
                if (consumed != raw.size()) {
                    throw std::invalid_argument(raw);
                }
                return ConfigValue(parsed);
            } catch (const std::exception&) {
                error = "Option --" + option_def.long_name + " expects an integer, got: " + raw;
                return std::nullopt;
            }
        }
        case CliOptionType::STRING_LIST: {
            std::vector<std::string> items = previous ? previous->asStringList() : std::vector<std::string>{};
            for (auto& item : splitList(raw, option_def.list_separator)) {
                items.push_back(std::move(item));
            }
            return ConfigValue(items);
        }
        case CliOptionType::STRING:
        default:
            return ConfigValue(raw);
    }
}

CliParseResult CliParser::parse(int argc, char* argv[]) const {
    std::vector<std::string> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse(arguments);
}

CliParseResult CliParser::parse(const std::vector<std::string>& arguments) const {
    CliParseResult result;

    auto fail = [&](CliParseStatus status, const std::string& message) {
        if (result.status == CliParseStatus::SUCCESS) {
            result.status = status;
        }
        result.errors.push_back(message);
    };

    auto store = [&](const CliOptionDefinition& option_def, const std::string& raw) {
        std::string error;
        auto previous = result.values.find(option_def.long_name);
        auto converted = convertValue(option_def, raw,
                                      previous == result.values.end() ? nullptr : &previous->second, error);
        if (!converted) {
            fail(CliParseStatus::INVALID_VALUE, error);
            return;
        }
        result.values[option_def.long_name] = *converted;
        if (!option_def.config_path.empty()) {
            result.overrides[option_def.config_path] = *converted;
        }
    };

    bool options_ended = false;
    for (std::size_t i = 0; i < arguments.size(); ++i) {
        const std::string& arg = arguments[i];

        if (options_ended || arg.size() < 2 || arg[0] != '-') {
            result.positionals.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_ended = true;
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            result.status = CliParseStatus::HELP_REQUESTED;
            result.help_text = generateHelpText();
            return result;
        }
        if (arg == "--version" || arg == "-V") {
            result.status = CliParseStatus::VERSION_REQUESTED;
            return result;
        }

        // EN: "--name=value", "--name value", "-n value"
        // FR: "--nom=valeur", "--nom valeur", "-n valeur"
        const CliOptionDefinition* option_def = nullptr;
        std::optional<std::string> inline_value;
        if (arg.rfind("--", 0) == 0) {
            std::string name = arg.substr(2);
            const auto equals = name.find('=');
            if (equals != std::string::npos) {
                inline_value = name.substr(equals + 1);
                name = name.substr(0, equals);
            }
            option_def = findLong(name);
        } else if (arg.size() == 2) {
            option_def = findShort(arg[1]);
        }

        if (!option_def) {
            fail(CliParseStatus::INVALID_OPTION, "Unknown option: " + arg);
            continue;
        }

        if (option_def->type == CliOptionType::BOOLEAN) {
            store(*option_def, inline_value.value_or("true"));
            continue;
        }

        if (inline_value) {
            store(*option_def, *inline_value);
        } else if (i + 1 < arguments.size()) {
            store(*option_def, arguments[++i]);
        } else {
            fail(CliParseStatus::MISSING_VALUE, "Option --" + option_def->long_name + " requires a value");
        }
    }

    for (const auto& option_def : options_) {
        if (result.values.count(option_def.long_name)) {
            continue;
        }
        if (option_def.default_value) {
            std::string error;
            if (auto converted = convertValue(option_def, *option_def.default_value, nullptr, error)) {
                result.values[option_def.long_name] = *converted;
            }
        } else if (option_def.required) {
            fail(CliParseStatus::MISSING_REQUIRED, "Missing required option --" + option_def.long_name);
        }
    }

    if (!result.errors.empty()) {
        LOG_DEBUG_META("cli", "Command line rejected",
                       {{"status", cliParseStatusToString(result.status)}, {"error", result.errors.front()}});
    }
    return result;
}

std::string CliParser::generateHelpText() const {
    std::ostringstream oss;
    oss << "Usage: " << program_name_ << " " << (usage_.empty() ? "[OPTIONS]" : usage_) << "\n\n";
    oss << "Options:\n";
    for (const auto& option_def : options_) {
        std::string flags = option_def.short_name ? std::string("-") + *option_def.short_name + ", " : "    ";
        flags += "--" + option_def.long_name;
        if (option_def.type != CliOptionType::BOOLEAN) {
            flags += " VALUE";
        }
        oss << "  " << std::left << std::setw(30) << flags << option_def.description;
        if (option_def.default_value) {
            oss << " (default: " << *option_def.default_value << ")";
        }
        oss << "\n";
    }
    oss << "  " << std::left << std::setw(30) << "-h, --help" << "Show this help\n";
    oss << "  " << std::left << std::setw(30) << "-V, --version" << "Show version\n";
    return oss.str();
}

void CliParser::applyOverrides(const CliParseResult& result, ConfigManager& config) {
    for (const auto& [path, value] : result.overrides) {
        const auto dot = path.find('.');
        if (dot == std::string::npos) {
            config.set("", path, value);
        } else {
            config.set(path.substr(0, dot), path.substr(dot + 1), value);
        }
        LOG_DEBUG("cli", "Configuration override applied: " + path);
    }
}

} // namespace TNORM
