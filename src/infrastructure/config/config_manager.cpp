// EN: ConfigManager implementation on yaml-cpp. A document is a map of sections, each a map of scalars or string lists.
// FR: Implémentation de ConfigManager sur yaml-cpp. Un document est une map de sections, chacune une map de scalaires ou listes.

#include "tnorm/infrastructure/config/config_manager.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <sstream>

namespace TNORM {

namespace {

std::string formatNumber(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

std::string joinValues(const std::vector<std::string>& values, const std::string& separator) {
    std::string joined;
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += values[i];
    }
    return joined;
}

std::vector<std::string> splitNonEmpty(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find(separator, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            parts.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

const char* typeName(ConfigType type) {
    switch (type) {
        case ConfigType::BOOL:        return "a boolean";
        case ConfigType::INT:         return "an integer";
        case ConfigType::NUMBER:      return "a number";
        case ConfigType::STRING:      return "a string";
        case ConfigType::STRING_LIST: return "a list of strings";
        case ConfigType::ANY:         break;
    }
    return "a value";
}

bool hasType(const ConfigValue& value, ConfigType type) {
    switch (type) {
        case ConfigType::BOOL:        return value.tryAs<bool>().has_value();
        case ConfigType::INT:         return value.tryAs<int>().has_value();
        case ConfigType::NUMBER:      return value.asNumber().has_value();
        case ConfigType::STRING:      return value.tryAs<std::string>().has_value();
        case ConfigType::STRING_LIST:
            return value.tryAs<std::vector<std::string>>().has_value() || value.tryAs<std::string>().has_value();
        case ConfigType::ANY:         break;
    }
    return true;
}

} // namespace

std::vector<std::string> ConfigValue::asStringList() const {
    if (auto list = tryAs<std::vector<std::string>>()) {
        return *list;
    }
    auto single = tryAs<std::string>();
    if (single && !single->empty()) {
        return {*single};
    }
    return {};
}

std::optional<double> ConfigValue::asNumber() const {
    if (auto integer = tryAs<int>()) {
        return static_cast<double>(*integer);
    }
    return tryAs<double>();
}

std::string ConfigValue::toString() const {
    if (!value_) {
        return "<empty>";
    }
    if (auto flag = tryAs<bool>()) {
        return *flag ? "true" : "false";
    }
    if (auto integer = tryAs<int>()) {
        return std::to_string(*integer);
    }
    if (auto number = tryAs<double>()) {
        return formatNumber(*number);
    }
    if (auto list = tryAs<std::vector<std::string>>()) {
        return "[" + joinValues(*list, ", ") + "]";
    }
    return as<std::string>();
}

ConfigManager& ConfigManager::getInstance() {
    static ConfigManager instance;
    return instance;
}

std::string ConfigManager::entryKey(const std::string& section, const std::string& key) {
    return section + "." + key;
}

bool ConfigManager::loadFromFile(const std::string& filename) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filename, ec)) {
        LOG_ERROR_META("config", "Configuration file not found", {{"file", filename}});
        return false;
    }

    try {
        if (!loadFromNode(YAML::LoadFile(filename))) {
            LOG_ERROR_META("config", "Configuration root must be a map", {{"file", filename}});
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR_META("config", "Configuration file rejected", {{"file", filename}, {"error", e.what()}});
        return false;
    }
    LOG_INFO_META("config", "Configuration loaded", {{"file", filename}});
    return true;
}

bool ConfigManager::loadFromString(const std::string& yaml_content) {
    try {
        if (!loadFromNode(YAML::Load(yaml_content))) {
            LOG_ERROR("config", "Configuration root must be a map");
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR_META("config", "Configuration text rejected", {{"error", e.what()}});
        return false;
    }
    return true;
}

// EN: A section holding a scalar instead of a map is stored under "<section>.value".
// FR: Une section contenant un scalaire au lieu d'une map est rangée sous "<section>.value".
bool ConfigManager::loadFromNode(const YAML::Node& root) {
    std::map<std::string, ConfigValue> loaded;

    if (!root.IsNull()) {
        if (!root.IsMap()) {
            return false;
        }
        for (const auto& section : root) {
            const std::string section_name = section.first.as<std::string>();
            if (!section.second.IsMap()) {
                loaded[entryKey(section_name, "value")] = parseYamlValue(section.second);
                continue;
            }
            for (const auto& entry : section.second) {
                loaded[entryKey(section_name, entry.first.as<std::string>())] = parseYamlValue(entry.second);
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(loaded);
    return true;
}

// EN: Plain scalars are typed bool, int, double, then string. Quoted scalars (tag "!") stay strings.
// FR: Les scalaires simples sont typés bool, int, double, puis chaîne. Les scalaires entre guillemets (tag "!") restent des chaînes.
ConfigValue ConfigManager::parseYamlValue(const YAML::Node& node) {
    if (node.IsNull()) {
        return ConfigValue(std::string());
    }
    if (node.IsSequence()) {
        std::vector<std::string> items;
        items.reserve(node.size());
        for (const auto& item : node) {
            items.push_back(expandVariables(item.as<std::string>()));
        }
        return ConfigValue(items);
    }
    if (!node.IsScalar()) {
        throw YAML::RepresentationException(node.Mark(), "nested maps are not supported in configuration values");
    }

    const std::string& text = node.Scalar();
    if (node.Tag() == "!") {
        return ConfigValue(expandVariables(text));
    }
    if (text == "true" || text == "false") {
        return ConfigValue(text == "true");
    }
    int integer = 0;
    if (text.find_first_of(".eE") == std::string::npos && YAML::convert<int>::decode(node, integer)) {
        return ConfigValue(integer);
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return ConfigValue(number);
    }
    return ConfigValue(expandVariables(text));
}

void ConfigManager::loadEnvironmentOverrides(const std::string& prefix) {
    enum class Kind { LIST, STRING, INTEGER };
    struct EnvOverride {
        const char* suffix;
        const char* section;
        const char* key;
        Kind kind;
    };
    static const EnvOverride kOverrides[] = {
        {"ALLOWED_ROOTS", "engine", "allowed_roots", Kind::LIST},
        {"PRESETS_DIR", "engine", "presets_dir", Kind::STRING},
        {"LEGACY_ENCODING", "engine", "legacy_encoding", Kind::STRING},
        {"SNIFF_SAMPLE_BYTES", "engine", "sniff_sample_bytes", Kind::INTEGER},
        {"LOG_LEVEL", "logging", "level", Kind::STRING},
        {"LOG_FILE", "logging", "file", Kind::STRING},
    };

    for (const auto& entry : kOverrides) {
        const std::string variable = prefix + entry.suffix;
        const char* raw = std::getenv(variable.c_str());
        if (!raw) {
            continue;
        }

        ConfigValue value;
        switch (entry.kind) {
            case Kind::LIST:
                value = ConfigValue(splitNonEmpty(raw, ';'));
                break;
            case Kind::STRING:
                value = ConfigValue(std::string(raw));
                break;
            case Kind::INTEGER: {
                char* end = nullptr;
                const long parsed = std::strtol(raw, &end, 10);
                if (end == raw || *end != '\0') {
                    LOG_WARN_META("config", "Ignoring non-numeric environment override",
                                  {{"variable", variable}, {"value", raw}});
                    continue;
                }
                value = ConfigValue(static_cast<int>(parsed));
                break;
            }
        }

        set(entry.section, entry.key, value);
        LOG_DEBUG_META("config", "Environment override applied",
                       {{"variable", variable}, {"key", entryKey(entry.section, entry.key)}});
    }
}

void ConfigManager::addValidationRules(const std::vector<ValidationRule>& rules) {
    std::lock_guard<std::mutex> lock(mutex_);
    rules_.insert(rules_.end(), rules.begin(), rules.end());
}

std::optional<std::string> ConfigManager::checkRule(const ConfigValue& value, const ValidationRule& rule) {
    const std::string prefix = "Configuration " + rule.key;

    if (!hasType(value, rule.type)) {
        return prefix + " must be " + typeName(rule.type);
    }

    if (rule.min_value || rule.max_value) {
        if (auto number = value.asNumber()) {
            if (rule.min_value && *number < *rule.min_value) {
                return prefix + " must be >= " + formatNumber(*rule.min_value);
            }
            if (rule.max_value && *number > *rule.max_value) {
                return prefix + " must be <= " + formatNumber(*rule.max_value);
            }
        }
    }

    if (!rule.allowed_values.empty()) {
        const std::string text = value.toString();
        if (std::find(rule.allowed_values.begin(), rule.allowed_values.end(), text) == rule.allowed_values.end()) {
            return prefix + " must be one of: " + joinValues(rule.allowed_values, ", ");
        }
    }
    return std::nullopt;
}

bool ConfigManager::validate(std::vector<std::string>& errors) const {
    std::lock_guard<std::mutex> lock(mutex_);
    errors.clear();

    for (const auto& rule : rules_) {
        auto it = entries_.find(rule.key);
        if (it == entries_.end() || !it->second.isValid()) {
            if (rule.required) {
                errors.push_back("Required configuration missing: " + rule.key);
            }
            continue;
        }
        if (auto error = checkRule(it->second, rule)) {
            errors.push_back(std::move(*error));
        }
    }
    return errors.empty();
}

ConfigValue ConfigManager::get(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(entryKey(section, key));
    return it == entries_.end() ? ConfigValue() : it->second;
}

void ConfigManager::set(const std::string& section, const std::string& key, const ConfigValue& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[entryKey(section, key)] = value;
}

bool ConfigManager::has(const std::string& section, const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(entryKey(section, key)) > 0;
}

void ConfigManager::remove(const std::string& section, const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(entryKey(section, key));
}

std::vector<std::string> ConfigManager::getSectionNames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [full_key, value] : entries_) {
        names.push_back(full_key.substr(0, full_key.find('.')));
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    rules_.clear();
}

std::string ConfigManager::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string text;
    for (const auto& [full_key, value] : entries_) {
        text += full_key + " = " + value.toString() + "\n";
    }
    return text;
}

// EN: ${NAME} is replaced by the environment value; unknown names and unterminated references are kept verbatim.
// FR: ${NOM} est remplacé par la valeur d'environnement; noms inconnus et références non fermées restent tels quels.
std::string ConfigManager::expandVariables(const std::string& value) {
    std::string result;
    std::size_t pos = 0;
    while (pos < value.size()) {
        const std::size_t open = value.find("${", pos);
        if (open == std::string::npos) {
            break;
        }
        const std::size_t close = value.find('}', open + 2);
        if (close == std::string::npos) {
            break;
        }
        result.append(value, pos, open - pos);
        const std::string name = value.substr(open + 2, close - open - 2);
        const char* env_value = name.empty() ? nullptr : std::getenv(name.c_str());
        result += env_value ? std::string(env_value) : value.substr(open, close - open + 1);
        pos = close + 1;
    }
    result.append(value, pos, std::string::npos);
    return result;
}

} // namespace TNORM
