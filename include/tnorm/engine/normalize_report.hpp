// EN: Request and report types of the single-file normalization pipeline
// FR: Types de requête et de rapport du pipeline de normalisation d'un fichier

#pragma once

#include "tnorm/csv/csv_codec.hpp"
#include "tnorm/csv/row_validator.hpp"
#include "tnorm/fs/file_meta.hpp"
#include "tnorm/preset/preset.hpp"
#include "tnorm/text/encoding_detector.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace TNORM::Engine {

struct NormalizeRequest {
    std::string input;                     // EN: Root-relative input path / FR: Chemin d'entrée relatif à une racine
    std::string output;                    // EN: Root-relative output path / FR: Chemin de sortie relatif à une racine
    std::optional<std::string> preset;     // EN: Preset name / FR: Nom du preset
    Preset::PresetFields overrides;        // EN: Explicit caller values / FR: Valeurs explicites de l'appelant
    std::optional<std::string> report;     // EN: Issue report destination / FR: Destination du rapport d'anomalies
    bool backup = true;
    bool overwrite = true;
    std::optional<char> delimiter;         // EN: Dialect overrides / FR: Surcharges de dialecte
    std::optional<char> quote_char;
    std::optional<bool> has_header;
};

// EN: Metadata of a written issue report
// FR: Métadonnées d'un rapport d'anomalies écrit
struct ReportFileInfo {
    FS::FileMeta meta;
    std::size_t issues{0};
    std::map<std::string, std::size_t> by_rule;
};

struct ValidationSummary {
    std::size_t issue_count{0};
    std::map<std::string, std::size_t> by_rule;
    std::vector<CSV::Issue> issues;
    std::optional<ReportFileInfo> report;
};

struct NormalizeReport {
    std::optional<std::string> preset;
    std::string input_path;
    FS::FileMeta output;
    std::optional<std::string> backup_path;
    std::string input_encoding;
    std::string output_encoding;
    Text::NewlineStyle input_newline{Text::NewlineStyle::CRLF};
    Text::NewlineStyle output_newline{Text::NewlineStyle::CRLF};
    CSV::Dialect dialect;
    std::size_t rows_in{0};
    std::size_t rows_out{0};
    std::vector<std::string> raw_headers;
    std::vector<std::string> normalized_headers;
    std::vector<std::string> mapped_headers;
    std::vector<std::string> output_headers;
    ValidationSummary validation;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

nlohmann::json issueToJson(const CSV::Issue& issue);
nlohmann::json fileMetaToJson(const FS::FileMeta& meta);
std::string delimiterToString(char delimiter);

} // namespace TNORM::Engine
