// EN: EngineSettings construction from the configuration store
// FR: Construction de EngineSettings depuis le magasin de configuration

#include "tnorm/core/engine_settings.hpp"
#include "tnorm/core/errors.hpp"

namespace TNORM {

EngineSettings EngineSettings::fromConfig(const ConfigManager& config) {
    EngineSettings settings;

    for (const auto& root : config.get("engine", "allowed_roots").asStringList()) {
        settings.allowed_roots.emplace_back(root);
    }

    const std::string presets_dir = config.get("engine", "presets_dir").asOrDefault<std::string>("");
    if (!presets_dir.empty()) {
        settings.presets_dir = presets_dir;
    }

    const std::string legacy = config.get("engine", "legacy_encoding").asOrDefault<std::string>("");
    if (!legacy.empty()) {
        settings.legacy_encoding = legacy;
    }

    ConfigValue sample = config.get("engine", "sniff_sample_bytes");
    if (sample.isValid()) {
        auto bytes = sample.tryAs<int>();
        if (!bytes || *bytes <= 0) {
            throw EngineError(ErrorCode::INVALID_ARGUMENT,
                              "engine.sniff_sample_bytes must be a positive integer, got " + sample.toString());
        }
        settings.sniff_sample_bytes = static_cast<std::size_t>(*bytes);
    }

    settings.bulk.output_dir = config.get("bulk", "output_dir").asOrDefault<std::string>(settings.bulk.output_dir);
    settings.bulk.out_suffix = config.get("bulk", "out_suffix").asOrDefault<std::string>(settings.bulk.out_suffix);
    settings.bulk.report_dir = config.get("bulk", "report_dir").asOrDefault<std::string>(settings.bulk.report_dir);

    const std::string level = config.get("logging", "level").asOrDefault<std::string>("info");
    auto parsed = parseLogLevel(level);
    if (!parsed) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "Unknown logging.level: " + level);
    }
    settings.log_level = *parsed;
    settings.log_file = config.get("logging", "file").asOrDefault<std::string>("");

    return settings;
}

std::vector<ConfigManager::ValidationRule> EngineSettings::validationRules() {
    std::vector<ConfigManager::ValidationRule> rules;

    ConfigManager::ValidationRule roots;
    roots.key = "engine.allowed_roots";
    roots.type = ConfigType::STRING_LIST;
    roots.description = "Directories the engine may read and write";
    rules.push_back(roots);

    ConfigManager::ValidationRule sample;
    sample.key = "engine.sniff_sample_bytes";
    sample.type = ConfigType::INT;
    sample.min_value = 64;
    sample.max_value = 1048576;
    rules.push_back(sample);

    ConfigManager::ValidationRule level;
    level.key = "logging.level";
    level.type = ConfigType::STRING;
    level.allowed_values = {"debug", "info", "warn", "error"};
    rules.push_back(level);

    return rules;
}

} // namespace TNORM
