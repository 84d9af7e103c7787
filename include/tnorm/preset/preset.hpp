// EN: Preset model - named, read-only normalization settings and the optional fields callers may override
// FR: Modèle de preset - paramètres de normalisation nommés en lecture seule et champs optionnels surchargeables

#pragma once

#include "tnorm/csv/header_normalizer.hpp"
#include "tnorm/csv/row_validator.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TNORM::Preset {

// EN: What to do when the output order names a column the input does not have
// FR: Que faire quand l'ordre de sortie nomme une colonne absente de l'entrée
enum class MissingColumnPolicy {
    FILL,   // EN: Fill with empty strings and warn / FR: Remplir de chaînes vides et avertir
    ERROR   // EN: Reject with MissingOrderColumns / FR: Rejeter avec MissingOrderColumns
};

std::string missingColumnPolicyToString(MissingColumnPolicy policy);
std::optional<MissingColumnPolicy> parseMissingColumnPolicy(const std::string& text);

// EN: Every preset attribute, each optional. Used both for preset files and for caller overrides.
// FR: Tous les attributs de preset, chacun optionnel. Sert pour les fichiers preset et les surcharges appelant.
struct PresetFields {
    std::optional<CSV::HeaderMap> header_map;
    std::optional<std::vector<std::string>> required_headers;
    std::optional<std::vector<std::string>> order;
    std::optional<bool> trim_whitespace;
    std::optional<bool> drop_empty_rows;
    std::optional<std::string> encoding_in;
    std::optional<std::string> encoding_out;
    std::optional<std::string> newline_out;
    std::optional<CSV::ValidationRules> validate;
    std::optional<MissingColumnPolicy> on_missing_order_column;
};

struct Preset {
    std::string name;                 // EN: File stem / FR: Nom du fichier sans extension
    std::filesystem::path source;     // EN: File it was loaded from / FR: Fichier d'origine
    PresetFields fields;
};

} // namespace TNORM::Preset
