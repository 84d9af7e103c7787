// EN: Immutable engine settings built once from configuration and handed to the engine constructor
// FR: Paramètres immuables du moteur construits une fois depuis la configuration et passés au constructeur

#pragma once

#include "tnorm/infrastructure/config/config_manager.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace TNORM {

// EN: Defaults applied to bulk runs when the caller leaves a field unset.
// FR: Valeurs par défaut des exécutions en masse quand l'appelant ne précise pas un champ.
struct BulkDefaults {
    std::string output_dir = "out";
    std::string out_suffix = "_norm.csv";
    std::string report_dir = "out";
};

struct EngineSettings {
    std::vector<std::filesystem::path> allowed_roots;
    std::filesystem::path presets_dir = "config/csv_presets";
    std::string legacy_encoding = "cp932";
    std::size_t sniff_sample_bytes = 4096;
    BulkDefaults bulk;
    LogLevel log_level = LogLevel::INFO;
    std::string log_file;

    // EN: Build settings from the "engine", "bulk" and "logging" sections. Throws EngineError(INVALID_ARGUMENT) on bad values.
    // FR: Construit les paramètres depuis les sections "engine", "bulk" et "logging". Lance EngineError(INVALID_ARGUMENT) si valeur invalide.
    static EngineSettings fromConfig(const ConfigManager& config);

    // EN: Validation rules registered by the CLI before reading settings.
    // FR: Règles de validation enregistrées par la CLI avant la lecture des paramètres.
    static std::vector<ConfigManager::ValidationRule> validationRules();
};

} // namespace TNORM
