// EN: CsvEngine facade. Owns the guard, preset store and writer built from one EngineSettings value.
// FR: Façade CsvEngine. Possède le garde, le magasin de presets et l'écrivain construits depuis un EngineSettings.

#pragma once

#include "tnorm/core/engine_settings.hpp"
#include "tnorm/engine/bulk_normalizer.hpp"
#include "tnorm/engine/normalize_report.hpp"
#include "tnorm/engine/single_file_normalizer.hpp"
#include "tnorm/fs/atomic_file_writer.hpp"
#include "tnorm/fs/file_service.hpp"
#include "tnorm/fs/path_guard.hpp"
#include "tnorm/preset/preset_store.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TNORM::Engine {

// EN: A record with its keys in insertion order
// FR: Un enregistrement dont les clés gardent l'ordre d'insertion
using KeyedRow = std::vector<std::pair<std::string, std::string>>;

struct InspectResult {
    FS::FileMeta meta;
    std::string encoding;
    Text::NewlineStyle newline{Text::NewlineStyle::CRLF};
    CSV::Dialect dialect;
    std::vector<std::string> headers;
    std::vector<KeyedRow> sample;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

struct ExportRequest {
    std::string output;
    std::vector<KeyedRow> rows;
    std::optional<std::vector<std::string>> columns;  // EN: Defaults to the keys of the first row / FR: Par défaut, clés de la première ligne
    std::string encoding_out = "utf-8-sig";
    std::string newline_out = "CRLF";
    bool quote_all = false;
    std::vector<std::string> excel_formula_columns;   // EN: Non-empty values written as ="value" / FR: Valeurs non vides écrites en ="valeur"
    bool sanitize_control_chars = false;              // EN: CR, LF and TAB become spaces / FR: CR, LF et TAB deviennent des espaces
    bool backup = true;
    bool overwrite = true;
};

struct ExportResult {
    FS::FileMeta meta;
    std::optional<std::string> backup_path;
    std::vector<std::string> columns;
    std::size_t rows{0};
    std::string encoding;
    std::vector<std::string> warnings;

    nlohmann::json toJson() const;
};

class CsvEngine {
public:
    static constexpr std::size_t kDefaultSampleRows = 10;

    explicit CsvEngine(EngineSettings settings);

    CsvEngine(const CsvEngine&) = delete;
    CsvEngine& operator=(const CsvEngine&) = delete;

    InspectResult inspect(const std::string& relpath, std::size_t sample_rows = kDefaultSampleRows) const;
    NormalizeReport normalize(const NormalizeRequest& request) const;
    ExportResult exportRows(const ExportRequest& request) const;
    BulkReport bulkNormalize(const BulkRequest& request) const;
    std::vector<std::string> listPresets() const;

    const EngineSettings& settings() const { return settings_; }
    const FS::PathGuard& guard() const { return guard_; }
    const FS::FileService& files() const { return files_; }
    SingleFileNormalizer& normalizer() { return normalizer_; }

    // EN: Render rows for export without touching the filesystem.
    // FR: Produit les lignes d'export sans toucher au système de fichiers.
    static std::string renderExport(const std::vector<KeyedRow>& rows, const std::vector<std::string>& columns,
                                    const ExportRequest& options);

    static std::vector<std::string> exportColumns(const ExportRequest& request);

private:
    // EN: Declaration order is construction order; later members hold references to earlier ones.
    // FR: L'ordre de déclaration est l'ordre de construction; les membres suivants référencent les précédents.
    EngineSettings settings_;
    FS::PathGuard guard_;
    Preset::PresetStore presets_;
    FS::AtomicFileWriter writer_;
    FS::FileService files_;
    SingleFileNormalizer normalizer_;
    BulkNormalizer bulk_;
};

} // namespace TNORM::Engine
