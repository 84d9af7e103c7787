// EN: Bulk orchestrator running the single-file pipeline over a discovered file set
// FR: Orchestrateur de masse exécutant le pipeline mono-fichier sur un ensemble de fichiers découverts

#pragma once

#include "tnorm/core/errors.hpp"
#include "tnorm/engine/normalize_report.hpp"
#include "tnorm/engine/single_file_normalizer.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TNORM::Engine {

struct BulkRequest {
    std::string subpath;                    // EN: Root-relative directory to scan / FR: Répertoire relatif à scanner
    std::string pattern = "*.csv";          // EN: fnmatch pattern on file names / FR: Motif fnmatch sur les noms de fichiers
    bool recursive = false;
    std::optional<std::string> output_dir;  // EN: Defaults to the bulk settings / FR: Par défaut, réglages de masse
    std::optional<std::string> out_suffix;
    std::optional<std::string> report_dir;  // EN: Empty string disables reports / FR: Chaîne vide désactive les rapports
    std::optional<std::string> preset;
    Preset::PresetFields overrides;
    bool backup = true;
    bool overwrite = true;
    bool dry_run = false;
    bool fail_fast = false;
    bool require_matches = false;
};

// EN: A discovered input, kept with the root it was found under
// FR: Une entrée découverte, avec la racine sous laquelle elle a été trouvée
struct MatchedFile {
    std::filesystem::path root;
    std::filesystem::path absolute;
    std::string relative;  // EN: Forward-slash path relative to its root / FR: Chemin relatif à sa racine, séparateurs '/'
};

struct BulkItem {
    bool ok = false;
    std::string input;
    std::string output;
    std::size_t issues{0};
    std::optional<ReportFileInfo> report;
    std::string error;
    std::optional<ErrorCode> code;

    nlohmann::json toJson() const;
};

struct BulkReport {
    bool ok = true;
    bool dry_run = false;
    std::size_t matched{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::size_t total_issues{0};
    std::vector<BulkItem> items;
    std::vector<std::string> preview;

    nlohmann::json toJson() const;
};

class BulkNormalizer {
public:
    BulkNormalizer(const EngineSettings& settings, const FS::PathGuard& guard,
                   const SingleFileNormalizer& normalizer);

    BulkReport run(const BulkRequest& request) const;

    // EN: Files under every root containing subpath whose names match pattern, sorted per root.
    // FR: Fichiers sous chaque racine contenant subpath dont le nom correspond au motif, triés par racine.
    std::vector<MatchedFile> discover(const std::string& subpath, const std::string& pattern, bool recursive) const;

    static bool matchesPattern(const std::string& file_name, const std::string& pattern);

private:
    const EngineSettings& settings_;
    const FS::PathGuard& guard_;
    const SingleFileNormalizer& normalizer_;
};

} // namespace TNORM::Engine
