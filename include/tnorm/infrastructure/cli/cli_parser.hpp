// EN: Command-line option parser with configuration overrides for tnormctl
// FR: Analyseur d'options de ligne de commande avec surcharges de configuration pour tnormctl

#pragma once

#include "tnorm/infrastructure/config/config_manager.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace TNORM {

// EN: CLI option value types
// FR: Types de valeur des options CLI
enum class CliOptionType {
    BOOLEAN,        // EN: Flag, optionally --flag=false / FR: Drapeau, éventuellement --flag=false
    INTEGER,        // EN: Integer value / FR: Valeur entière
    STRING,         // EN: String value / FR: Valeur chaîne
    STRING_LIST     // EN: Separator-split, repeatable / FR: Découpée par séparateur, répétable
};

enum class CliParseStatus {
    SUCCESS,
    HELP_REQUESTED,
    VERSION_REQUESTED,
    INVALID_OPTION,     // EN: Unknown option / FR: Option inconnue
    MISSING_VALUE,      // EN: Option value absent / FR: Valeur d'option absente
    INVALID_VALUE,      // EN: Value does not convert to the option type / FR: Valeur non convertible vers le type de l'option
    MISSING_REQUIRED    // EN: Required option absent / FR: Option requise absente
};

std::string cliParseStatusToString(CliParseStatus status);

struct CliOptionDefinition {
    std::string long_name;                      // EN: Without the leading "--" / FR: Sans le "--" initial
    std::optional<char> short_name;
    CliOptionType type = CliOptionType::STRING;
    std::string description;
    std::string config_path;                    // EN: "section.key" override target, empty for none / FR: Cible "section.cle", vide si aucune
    std::optional<std::string> default_value;
    bool required = false;
    char list_separator = ',';                  // EN: STRING_LIST only / FR: STRING_LIST uniquement
};

struct CliParseResult {
    CliParseStatus status = CliParseStatus::SUCCESS;
    std::vector<std::string> positionals;
    std::unordered_map<std::string, ConfigValue> values;     // EN: By long name / FR: Par nom long
    std::unordered_map<std::string, ConfigValue> overrides;  // EN: By config path / FR: Par chemin de configuration
    std::vector<std::string> errors;
    std::string help_text;

    bool ok() const { return status == CliParseStatus::SUCCESS; }
    bool has(const std::string& name) const { return values.count(name) > 0; }

    std::string getString(const std::string& name, const std::string& default_value = "") const;
    std::optional<std::string> getOptionalString(const std::string& name) const;
    bool getFlag(const std::string& name, bool default_value = false) const;
    std::optional<int> getInt(const std::string& name) const;
    std::vector<std::string> getList(const std::string& name) const;
};

class CliParser {
public:
    explicit CliParser(std::string program_name = "tnormctl");

    void addOption(const CliOptionDefinition& option_def);
    void addOptions(const std::vector<CliOptionDefinition>& option_defs);

    // EN: --config, --log-level, --log-file, --roots, --presets-dir
    // FR: --config, --log-level, --log-file, --roots, --presets-dir
    void addStandardOptions();

    CliParseResult parse(int argc, char* argv[]) const;
    CliParseResult parse(const std::vector<std::string>& arguments) const;

    std::string generateHelpText() const;
    bool hasOption(const std::string& long_name) const;

    void setUsage(const std::string& usage) { usage_ = usage; }

    // EN: Write every override of the result into the configuration manager.
    // FR: Écrit chaque surcharge du résultat dans le gestionnaire de configuration.
    static void applyOverrides(const CliParseResult& result, ConfigManager& config);

private:
    std::string program_name_;
    std::string usage_;
    std::vector<CliOptionDefinition> options_;

    const CliOptionDefinition* findLong(const std::string& name) const;
    const CliOptionDefinition* findShort(char name) const;
    static std::optional<ConfigValue> convertValue(const CliOptionDefinition& option_def, const std::string& raw,
                                                   const ConfigValue* previous, std::string& error);
};

} // namespace TNORM
