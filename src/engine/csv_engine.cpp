// EN: CsvEngine implementation
// FR: Implémentation de CsvEngine

#include "tnorm/engine/csv_engine.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/csv/dialect_sniffer.hpp"
#include "tnorm/csv/header_normalizer.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/transcoder.hpp"

#include <algorithm>
#include <set>

namespace TNORM::Engine {

nlohmann::json InspectResult::toJson() const {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& record : sample) {
        nlohmann::json row = nlohmann::json::object();
        for (const auto& [key, value] : record) {
            row[key] = value;
        }
        rows.push_back(row);
    }

    return {
        {"meta", fileMetaToJson(meta)},
        {"encoding", encoding},
        {"newline", Text::newlineToString(newline)},
        {"delimiter", delimiterToString(dialect.delimiter)},
        {"quotechar", std::string(1, dialect.quote_char)},
        {"has_header", dialect.has_header},
        {"headers", headers},
        {"sample", rows},
        {"warnings", warnings},
    };
}

nlohmann::json ExportResult::toJson() const {
    nlohmann::json json = {
        {"ok", true},
        {"path", meta.path.string()},
        {"size", meta.size},
        {"mtime", meta.mtime},
        {"columns", columns},
        {"rows", rows},
        {"encoding", encoding},
        {"warnings", warnings},
    };
    json["backup_path"] = backup_path ? nlohmann::json(*backup_path) : nlohmann::json(nullptr);
    return json;
}

CsvEngine::CsvEngine(EngineSettings settings)
    : settings_(std::move(settings)),
      guard_(settings_.allowed_roots),
      presets_(settings_.presets_dir),
      writer_(guard_),
      files_(guard_, writer_),
      normalizer_(settings_, guard_, presets_, writer_),
      bulk_(settings_, guard_, normalizer_) {
    LOG_DEBUG_META("engine", "Engine constructed",
                   {{"roots", std::to_string(guard_.roots().size())},
                    {"presets_dir", settings_.presets_dir.string()}});
}

InspectResult CsvEngine::inspect(const std::string& relpath, std::size_t sample_rows) const {
    const auto path = guard_.resolve(relpath);

    InspectResult result;
    result.meta = FS::statFile(path);
    const std::string raw = FS::readFileBytes(path);

    result.encoding = Text::EncodingDetector(settings_.legacy_encoding).detect(raw);
    result.newline = Text::EncodingDetector::detectNewline(raw);

    const Text::DecodeResult decoded = Text::Transcoder::decodePermissive(raw, result.encoding);
    if (decoded.replacements > 0) {
        result.warnings.push_back(std::to_string(decoded.replacements) + " undecodable byte(s) replaced with U+FFFD");
    }
    result.dialect = CSV::DialectSniffer(settings_.sniff_sample_bytes).sniff(decoded.text).dialect;

    CSV::CsvReader reader(decoded.text, result.dialect.delimiter, result.dialect.quote_char);
    CSV::Record record;
    if (result.dialect.has_header && reader.next(record)) {
        for (const auto& cell : record) {
            result.headers.push_back(CSV::HeaderNormalizer::canonicalize(cell));
        }
        const std::set<std::string> unique(result.headers.begin(), result.headers.end());
        if (unique.size() != result.headers.size()) {
            result.warnings.push_back("duplicate headers after normalization");
        }
    }

    while (result.sample.size() < sample_rows && reader.next(record)) {
        KeyedRow row;
        const std::size_t width = std::max(result.headers.size(), record.size());
        for (std::size_t i = 0; i < width; ++i) {
            std::string key = i < result.headers.size() ? result.headers[i] : "_" + std::to_string(i);
            row.emplace_back(std::move(key), i < record.size() ? record[i] : std::string());
        }
        result.sample.push_back(std::move(row));
    }

    LOG_INFO_META("engine", "Inspected file",
                  {{"path", path.string()}, {"encoding", result.encoding},
                   {"delimiter", delimiterToString(result.dialect.delimiter)}});
    return result;
}

NormalizeReport CsvEngine::normalize(const NormalizeRequest& request) const {
    CorrelationScope correlation;
    return normalizer_.run(request);
}

BulkReport CsvEngine::bulkNormalize(const BulkRequest& request) const {
    CorrelationScope correlation;
    return bulk_.run(request);
}

std::vector<std::string> CsvEngine::listPresets() const {
    return presets_.list();
}

std::vector<std::string> CsvEngine::exportColumns(const ExportRequest& request) {
    if (request.columns && !request.columns->empty()) {
        return *request.columns;
    }
    std::vector<std::string> columns;
    if (!request.rows.empty()) {
        for (const auto& [key, value] : request.rows.front()) {
            if (std::find(columns.begin(), columns.end(), key) == columns.end()) {
                columns.push_back(key);
            }
        }
    }
    return columns;
}

std::string CsvEngine::renderExport(const std::vector<KeyedRow>& rows, const std::vector<std::string>& columns,
                                    const ExportRequest& options) {
    const auto newline = Text::parseNewline(options.newline_out);
    if (!newline) {
        throw InvalidArgumentError("invalid newline_out: " + options.newline_out);
    }
    const std::string_view terminator = Text::newlineSequence(*newline);
    const std::set<std::string> formula_columns(options.excel_formula_columns.begin(),
                                                options.excel_formula_columns.end());

    CSV::WriteOptions write_options;
    write_options.quote_all = options.quote_all;

    std::string text = CSV::CsvWriter::formatRow(columns, write_options);
    text += terminator;

    for (const auto& row : rows) {
        CSV::Record record;
        record.reserve(columns.size());
        for (const auto& column : columns) {
            std::string value;
            // EN: Last occurrence of a key wins.
            // FR: La dernière occurrence d'une clé l'emporte.
            for (const auto& [key, cell] : row) {
                if (key == column) {
                    value = cell;
                }
            }
            if (options.sanitize_control_chars) {
                std::replace_if(value.begin(), value.end(),
                                [](char c) { return c == '\r' || c == '\n' || c == '\t'; }, ' ');
            }
            if (formula_columns.count(column) && !value.empty()) {
                value = "=\"" + value + "\"";
            }
            record.push_back(std::move(value));
        }
        text += CSV::CsvWriter::formatRow(record, write_options);
        text += terminator;
    }
    return text;
}

ExportResult CsvEngine::exportRows(const ExportRequest& request) const {
    const auto path = guard_.resolve(request.output);

    ExportResult result;
    result.encoding = Text::Transcoder::canonicalName(request.encoding_out);
    result.columns = exportColumns(request);
    result.rows = request.rows.size();

    const std::string text = renderExport(request.rows, result.columns, request);
    const Text::EncodeResult encoded = Text::Transcoder::encode(text, result.encoding);
    if (encoded.replacements > 0) {
        result.warnings.push_back(std::to_string(encoded.replacements) + " character(s) not representable in " +
                                  result.encoding + " replaced with '?'");
    }

    FS::WriteOptions options;
    options.backup = request.backup;
    options.overwrite = request.overwrite;
    const FS::WriteResult written = writer_.write(path, encoded.bytes, options);
    result.meta = written.meta;
    if (written.backup_path) {
        result.backup_path = written.backup_path->string();
    }

    LOG_INFO_META("engine", "Exported rows",
                  {{"path", path.string()}, {"rows", std::to_string(result.rows)},
                   {"columns", std::to_string(result.columns.size())}});
    return result;
}

} // namespace TNORM::Engine
