// EN: YAML configuration store: "section.key" entries with typed values, validation rules and TNORM_ environment overrides
// FR: Magasin de configuration YAML : entrées "section.clé" typées, règles de validation et surcharges d'environnement TNORM_

#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace YAML { class Node; }

namespace TNORM {

class ConfigValue {
public:
    using ValueType = std::variant<bool, int, double, std::string, std::vector<std::string>>;

    ConfigValue() = default;

    template<typename T>
    ConfigValue(const T& value) : value_(ValueType(value)) {}

    ConfigValue(const char* value) : value_(ValueType(std::string(value))) {}

    // EN: Throws std::runtime_error when empty or holding another type.
    // FR: Lance std::runtime_error si vide ou d'un autre type.
    template<typename T>
    T as() const {
        if (!value_) {
            throw std::runtime_error("ConfigValue is empty");
        }
        if (const T* typed = std::get_if<T>(&*value_)) {
            return *typed;
        }
        throw std::runtime_error("ConfigValue type mismatch");
    }

    template<typename T>
    std::optional<T> tryAs() const {
        if (value_) {
            if (const T* typed = std::get_if<T>(&*value_)) {
                return *typed;
            }
        }
        return std::nullopt;
    }

    template<typename T>
    T asOrDefault(const T& default_value) const {
        return tryAs<T>().value_or(default_value);
    }

    // EN: A non-empty scalar string reads as a one-element list.
    // FR: Une chaîne scalaire non vide se lit comme une liste à un élément.
    std::vector<std::string> asStringList() const;

    // EN: Integers widen to double.
    // FR: Les entiers sont élargis en double.
    std::optional<double> asNumber() const;

    bool isValid() const { return value_.has_value(); }

    std::string toString() const;

private:
    std::optional<ValueType> value_;
};

// EN: Expected type of a validated entry. STRING_LIST also accepts a single string.
// FR: Type attendu d'une entrée validée. STRING_LIST accepte aussi une chaîne seule.
enum class ConfigType {
    ANY,
    BOOL,
    INT,
    NUMBER,
    STRING,
    STRING_LIST
};

class ConfigManager {
public:
    struct ValidationRule {
        std::string key;  // EN: "section.key" / FR: "section.clé"
        ConfigType type = ConfigType::ANY;
        bool required = false;
        std::optional<double> min_value;
        std::optional<double> max_value;
        std::vector<std::string> allowed_values;
        std::string description;
    };

    static ConfigManager& getInstance();

    // EN: Replace the current content. False on a missing file, a YAML error or a non-map document.
    // FR: Remplace le contenu courant. Faux si fichier absent, erreur YAML ou document qui n'est pas une map.
    bool loadFromFile(const std::string& filename);
    bool loadFromString(const std::string& yaml_content);

    // EN: <prefix>ALLOWED_ROOTS (';'-separated), PRESETS_DIR, LEGACY_ENCODING, SNIFF_SAMPLE_BYTES, LOG_LEVEL, LOG_FILE.
    // FR: <prefix>ALLOWED_ROOTS (séparées par ';'), PRESETS_DIR, LEGACY_ENCODING, SNIFF_SAMPLE_BYTES, LOG_LEVEL, LOG_FILE.
    void loadEnvironmentOverrides(const std::string& prefix = "TNORM_");

    void addValidationRules(const std::vector<ValidationRule>& rules);

    // EN: Check every rule in registration order; errors is filled with one message per failure.
    // FR: Vérifie chaque règle dans l'ordre d'enregistrement; errors reçoit un message par échec.
    bool validate(std::vector<std::string>& errors) const;

    ConfigValue get(const std::string& section, const std::string& key) const;
    void set(const std::string& section, const std::string& key, const ConfigValue& value);
    bool has(const std::string& section, const std::string& key) const;
    void remove(const std::string& section, const std::string& key);

    std::vector<std::string> getSectionNames() const;

    void reset();

    // EN: "section.key = value" lines in key order.
    // FR: Lignes "section.clé = valeur" dans l'ordre des clés.
    std::string dump() const;

    static std::string expandVariables(const std::string& value);

private:
    ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    bool loadFromNode(const YAML::Node& root);

    static std::string entryKey(const std::string& section, const std::string& key);
    static ConfigValue parseYamlValue(const YAML::Node& node);
    static std::optional<std::string> checkRule(const ConfigValue& value, const ValidationRule& rule);

    mutable std::mutex mutex_;
    std::map<std::string, ConfigValue> entries_;  // EN: Keyed by "section.key" / FR: Indexé par "section.clé"
    std::vector<ValidationRule> rules_;
};

} // namespace TNORM
