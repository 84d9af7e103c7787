// EN: Single-file normalization pipeline implementation
// FR: Implémentation du pipeline de normalisation d'un fichier

#include "tnorm/engine/single_file_normalizer.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/csv/dialect_sniffer.hpp"
#include "tnorm/csv/header_normalizer.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/transcoder.hpp"
#include "tnorm/text/unicode_text.hpp"

#include <algorithm>
#include <set>
#include <unordered_map>

namespace TNORM::Engine {

std::string normalizeStateToString(NormalizeState state) {
    switch (state) {
        case NormalizeState::START:                    return "Start";
        case NormalizeState::DETECTED:                 return "Detected";
        case NormalizeState::SNIFFED:                  return "Sniffed";
        case NormalizeState::HEADER_RESOLVED:          return "HeaderResolved";
        case NormalizeState::REQUIRED_HEADERS_CHECKED: return "RequiredHeadersChecked";
        case NormalizeState::STREAMING:                return "Streaming";
        case NormalizeState::WRITTEN:                  return "Written";
        case NormalizeState::REPORT_WRITTEN:           return "ReportWritten";
        case NormalizeState::DONE:                     return "Done";
        case NormalizeState::FAILED:                   return "Failed";
        default:                                       return "Unknown";
    }
}

namespace {

// EN: Where an output column takes its value from in each input record.
// FR: Origine de la valeur d'une colonne de sortie dans chaque enregistrement d'entrée.
struct ColumnSource {
    std::optional<std::size_t> header_index;  // EN: Last header cell with that name / FR: Dernière cellule d'en-tête de ce nom
    std::optional<std::size_t> extra_index;   // EN: Extra cell named c<i> / FR: Cellule supplémentaire nommée c<i>
};

// EN: "c<i>" addresses cell i of a record wider than its header; "c07" style leading zeros are not accepted.
// FR: "c<i>" désigne la cellule i d'un enregistrement plus large que son en-tête; les zéros initiaux ("c07") sont refusés.
std::optional<std::size_t> extraIndexOf(const std::string& column, std::size_t header_width) {
    if (column.size() < 2 || column[0] != 'c') {
        return std::nullopt;
    }
    std::size_t index = 0;
    for (std::size_t i = 1; i < column.size(); ++i) {
        if (column[i] < '0' || column[i] > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<std::size_t>(column[i] - '0');
    }
    if (column.size() > 2 && column[1] == '0') {
        return std::nullopt;
    }
    return index >= header_width ? std::optional<std::size_t>(index) : std::nullopt;
}

} // namespace

SingleFileNormalizer::SingleFileNormalizer(const EngineSettings& settings, const FS::PathGuard& guard,
                                           const Preset::PresetStore& presets, const FS::AtomicFileWriter& writer)
    : settings_(settings), guard_(guard), presets_(presets), writer_(writer) {}

// EN: Every state change is logged and reported to the optional observer (used by tests).
// FR: Chaque changement d'état est journalisé et signalé à l'observateur facultatif (utilisé par les tests).
void SingleFileNormalizer::transition(NormalizeState& current, NormalizeState next) const {
    LOG_DEBUG("normalizer", normalizeStateToString(current) + " -> " + normalizeStateToString(next));
    current = next;
    if (observer_) {
        observer_(next);
    }
}

// EN: Preset errors are raised before any path is resolved or file is read.
// FR: Les erreurs de preset sont levées avant toute résolution de chemin ou lecture de fichier.
NormalizeReport SingleFileNormalizer::run(const NormalizeRequest& request) const {
    Preset::EffectiveConfig config;
    try {
        config = Preset::PresetResolver(presets_).resolve(request.preset, request.overrides);
    } catch (const std::exception& e) {
        LOG_ERROR_META("normalizer", "Preset resolution failed", {{"input", request.input}, {"error", e.what()}});
        NormalizeState state = NormalizeState::START;
        transition(state, NormalizeState::FAILED);
        throw;
    }
    return run(request, config);
}

NormalizeReport SingleFileNormalizer::run(const NormalizeRequest& request, const Preset::EffectiveConfig& config) const {
    NormalizeState state = NormalizeState::START;
    NormalizeReport report;
    report.preset = config.preset_name;

    try {
        // EN: Every path is resolved before any I/O so confinement errors win over missing files.
        // FR: Tous les chemins sont résolus avant toute E/S pour que le confinement prime sur les fichiers absents.
        const auto input_path = guard_.resolve(request.input);
        const auto output_path = guard_.resolve(request.output);
        std::optional<std::filesystem::path> report_path;
        if (request.report && !request.report->empty()) {
            report_path = guard_.resolve(*request.report);
        }
        report.input_path = input_path.string();

        LOG_INFO_META("normalizer", "Normalizing file",
                      {{"input", input_path.string()}, {"output", output_path.string()},
                       {"preset", config.preset_name.value_or("")}});

        // Start -> Detected
        const std::string raw = FS::readFileBytes(input_path);
        if (config.encoding_in.value == "auto") {
            report.input_encoding = Text::EncodingDetector(settings_.legacy_encoding).detect(raw);
        } else {
            report.input_encoding = Text::Transcoder::canonicalName(config.encoding_in.value);
        }
        report.input_newline = Text::EncodingDetector::detectNewline(raw);
        transition(state, NormalizeState::DETECTED);

        // Detected -> Sniffed
        const Text::DecodeResult decoded = Text::Transcoder::decodePermissive(raw, report.input_encoding);
        if (decoded.replacements > 0) {
            report.warnings.push_back(std::to_string(decoded.replacements) + " undecodable byte(s) replaced with U+FFFD");
        }
        const CSV::SniffResult sniffed = CSV::DialectSniffer(settings_.sniff_sample_bytes).sniff(decoded.text);
        report.dialect = sniffed.dialect;
        if (request.delimiter) report.dialect.delimiter = *request.delimiter;
        if (request.quote_char) report.dialect.quote_char = *request.quote_char;
        if (request.has_header) report.dialect.has_header = *request.has_header;
        transition(state, NormalizeState::SNIFFED);

        // Sniffed -> HeaderResolved
        CSV::CsvReader reader(decoded.text, report.dialect.delimiter, report.dialect.quote_char);
        CSV::Record first;
        const bool has_first = reader.next(first);
        std::optional<CSV::Record> pending_row;
        std::vector<std::string> header_cells;
        if (report.dialect.has_header) {
            header_cells = first;
            report.raw_headers = first;
        } else {
            for (std::size_t i = 0; i < first.size(); ++i) {
                header_cells.push_back("c" + std::to_string(i));
            }
            if (has_first) {
                pending_row = first;
            }
        }

        const CSV::HeaderNormalizer normalizer(config.header_map.value);
        CSV::HeaderNormalizer::Result headers = normalizer.normalize(header_cells);
        report.normalized_headers = headers.normalized;
        report.mapped_headers = headers.mapped;
        report.warnings.insert(report.warnings.end(), headers.warnings.begin(), headers.warnings.end());
        transition(state, NormalizeState::HEADER_RESOLVED);

        // HeaderResolved -> RequiredHeadersChecked
        // EN: A miss stops here; nothing has been written yet.
        // FR: Un manque s'arrête ici; rien n'a encore été écrit.
        const std::set<std::string> present(headers.mapped.begin(), headers.mapped.end());
        std::vector<std::string> missing;
        for (const auto& required : config.required_headers.value) {
            if (!present.count(required)) {
                missing.push_back(required);
            }
        }
        if (!missing.empty()) {
            throw MissingRequiredHeadersError(input_path.string(), missing);
        }
        transition(state, NormalizeState::REQUIRED_HEADERS_CHECKED);

        // RequiredHeadersChecked -> Streaming
        report.output_headers = config.order.value.empty() ? headers.mapped : config.order.value;

        // EN: With duplicated mapped headers the rightmost cell feeds the output column.
        // FR: Avec des en-têtes mappés en double, la cellule la plus à droite alimente la colonne de sortie.
        std::unordered_map<std::string, std::size_t> last_index;
        for (std::size_t i = 0; i < headers.mapped.size(); ++i) {
            last_index[headers.mapped[i]] = i;
        }

        std::vector<ColumnSource> sources;
        std::vector<std::string> absent;
        for (const auto& column : report.output_headers) {
            ColumnSource source;
            auto it = last_index.find(column);
            if (it != last_index.end()) {
                source.header_index = it->second;
            }
            source.extra_index = extraIndexOf(column, headers.mapped.size());
            if (!source.header_index && !source.extra_index) {
                absent.push_back(column);
            }
            sources.push_back(source);
        }
        if (!absent.empty()) {
            if (config.on_missing_order_column.value == Preset::MissingColumnPolicy::ERROR) {
                throw MissingOrderColumnsError(input_path.string(), absent);
            }
            for (const auto& column : absent) {
                report.warnings.push_back("order column absent from input, filled with empty values: " + column);
            }
        }

        CSV::RowValidator validator(report.output_headers, config.validate.value);
        report.warnings.insert(report.warnings.end(), validator.warnings().begin(), validator.warnings().end());
        transition(state, NormalizeState::STREAMING);

        const std::string_view newline = Text::newlineSequence(config.newline_out.value);
        std::string body = CSV::CsvWriter::formatRow(report.output_headers);
        body += newline;

        auto processRecord = [&](const CSV::Record& record, std::size_t row_number) {
            ++report.rows_in;
            std::vector<std::string> out_row;
            out_row.reserve(sources.size());
            for (const auto& source : sources) {
                std::string value;
                if (source.extra_index && *source.extra_index < record.size()) {
                    value = record[*source.extra_index];
                } else if (source.header_index && *source.header_index < record.size()) {
                    value = record[*source.header_index];
                }
                if (config.trim_whitespace.value) {
                    value = Text::trimWhitespace(value);
                }
                out_row.push_back(std::move(value));
            }

            // EN: Validation sees every row, including those dropped as empty below.
            // FR: La validation voit toutes les lignes, y compris celles écartées plus bas car vides.
            validator.feed(out_row, row_number);

            const bool all_empty = std::all_of(out_row.begin(), out_row.end(),
                                               [](const std::string& value) { return value.empty(); });
            if (config.drop_empty_rows.value && all_empty) {
                return;
            }
            body += CSV::CsvWriter::formatRow(out_row);
            body += newline;
            ++report.rows_out;
        };

        if (pending_row) {
            processRecord(*pending_row, reader.recordNumber());
        }
        CSV::Record record;
        while (reader.next(record)) {
            processRecord(record, reader.recordNumber());
        }
        if (reader.endedInsideQuotes()) {
            report.warnings.push_back("input ended inside a quoted field");
        }

        // Streaming -> Written
        report.output_encoding = config.encoding_out.value;
        report.output_newline = config.newline_out.value;
        const Text::EncodeResult encoded = Text::Transcoder::encode(body, report.output_encoding);
        if (encoded.replacements > 0) {
            report.warnings.push_back(std::to_string(encoded.replacements) + " character(s) not representable in " +
                                      report.output_encoding + " replaced with '?'");
        }

        FS::WriteOptions write_options;
        write_options.backup = request.backup;
        write_options.overwrite = request.overwrite;
        const FS::WriteResult written = writer_.write(output_path, encoded.bytes, write_options);
        report.output = written.meta;
        if (written.backup_path) {
            report.backup_path = written.backup_path->string();
        }
        transition(state, NormalizeState::WRITTEN);

        // Written -> ReportWritten
        report.validation.issues = validator.finalize();
        report.validation.issue_count = report.validation.issues.size();
        report.validation.by_rule = CSV::RowValidator::countsByRule(report.validation.issues);

        // EN: The issue report is always UTF-8 with BOM so spreadsheet tools open it correctly.
        // FR: Le rapport d'anomalies est toujours en UTF-8 avec BOM pour être bien ouvert par les tableurs.
        if (report_path) {
            const std::string report_text = renderIssueReport(report.validation.issues, config.newline_out.value);
            const Text::EncodeResult report_bytes = Text::Transcoder::encode(report_text, "utf-8-sig");
            FS::WriteOptions report_options;
            report_options.backup = true;
            report_options.overwrite = true;
            const FS::WriteResult report_written = writer_.write(*report_path, report_bytes.bytes, report_options);

            ReportFileInfo info;
            info.meta = report_written.meta;
            info.issues = report.validation.issue_count;
            info.by_rule = report.validation.by_rule;
            report.validation.report = info;
            transition(state, NormalizeState::REPORT_WRITTEN);
        }

        transition(state, NormalizeState::DONE);

        for (const auto& warning : report.warnings) {
            LOG_WARN_META("normalizer", warning, {{"input", report.input_path}});
        }
        LOG_INFO_META("normalizer", "Normalization completed",
                      {{"input", report.input_path},
                       {"rows_in", std::to_string(report.rows_in)},
                       {"rows_out", std::to_string(report.rows_out)},
                       {"issues", std::to_string(report.validation.issue_count)}});
        return report;
    } catch (const std::exception& e) {
        LOG_ERROR_META("normalizer", "Normalization failed",
                       {{"input", request.input}, {"state", normalizeStateToString(state)}, {"error", e.what()}});
        transition(state, NormalizeState::FAILED);
        throw;
    }
}

// EN: Columns row,column,rule,value,message; a missing value renders as an empty cell.
// FR: Colonnes row,column,rule,value,message; une valeur absente donne une cellule vide.
std::string SingleFileNormalizer::renderIssueReport(const std::vector<CSV::Issue>& issues, Text::NewlineStyle newline) {
    const std::string_view terminator = Text::newlineSequence(newline);
    std::string text = CSV::CsvWriter::formatRow({"row", "column", "rule", "value", "message"});
    text += terminator;
    for (const auto& issue : issues) {
        text += CSV::CsvWriter::formatRow(
            {std::to_string(issue.row), issue.column, issue.rule, issue.value.value_or(""), issue.message});
        text += terminator;
    }
    return text;
}

} // namespace TNORM::Engine
