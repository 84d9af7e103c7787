// EN: tnormctl, command-line front end over CsvEngine. Results are JSON on stdout, logs NDJSON on stderr.
// FR: tnormctl, interface en ligne de commande de CsvEngine. Résultats JSON sur stdout, journaux NDJSON sur stderr.

#include "tnorm/core/engine_settings.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/engine/csv_engine.hpp"
#include "tnorm/infrastructure/cli/cli_parser.hpp"
#include "tnorm/infrastructure/config/config_manager.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/preset/preset_store.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace TNORM;

namespace {

const char* const kVersion = "1.0.0";

enum ExitCode {
    EXIT_OK = 0,
    EXIT_FAILURE_GENERIC = 1,
    EXIT_USAGE = 2,
    EXIT_FORBIDDEN = 3,
    EXIT_NOT_FOUND = 4,
    EXIT_UNPROCESSABLE = 5,
    EXIT_CONFLICT = 6
};

int exitCodeForStatus(int status) {
    switch (status) {
        case 400: return EXIT_USAGE;
        case 403: return EXIT_FORBIDDEN;
        case 404: return EXIT_NOT_FOUND;
        case 409: return EXIT_CONFLICT;
        case 422: return EXIT_UNPROCESSABLE;
        default:  return EXIT_FAILURE_GENERIC;
    }
}

void printJson(const nlohmann::json& json) {
    std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

nlohmann::json errorToJson(const EngineError& e) {
    return {
        {"ok", false},
        {"error", {
            {"code", errorCodeToString(e.code())},
            {"status", e.status()},
            {"message", e.what()},
            {"path", e.path()},
            {"details", e.details()},
        }},
    };
}

CliOptionDefinition option(const std::string& name, CliOptionType type, const std::string& description,
                           std::optional<std::string> default_value = std::nullopt) {
    CliOptionDefinition def;
    def.long_name = name;
    def.type = type;
    def.description = description;
    def.default_value = std::move(default_value);
    return def;
}

CliParser buildParser() {
    CliParser parser("tnormctl");
    parser.setUsage("[OPTIONS] <inspect|normalize|export|bulk|presets|files-list|files-read|files-write>");
    parser.addStandardOptions();

    CliOptionDefinition map_option = option("map", CliOptionType::STRING_LIST, "Header mapping raw=canonical, repeatable");
    map_option.list_separator = '\n';

    parser.addOptions({
        option("input", CliOptionType::STRING, "Root-relative input path"),
        option("output", CliOptionType::STRING, "Root-relative output path"),
        option("sample-rows", CliOptionType::INTEGER, "Rows returned by inspect", "10"),
        option("preset", CliOptionType::STRING, "Preset name"),
        option("overrides", CliOptionType::STRING, "Preset-format YAML/JSON file of explicit overrides"),
        map_option,
        option("required", CliOptionType::STRING_LIST, "Required headers, comma-separated"),
        option("order", CliOptionType::STRING_LIST, "Output column order, comma-separated"),
        option("trim", CliOptionType::BOOLEAN, "Trim whitespace in values"),
        option("drop-empty", CliOptionType::BOOLEAN, "Drop rows whose values are all empty"),
        option("encoding-in", CliOptionType::STRING, "Input encoding or auto"),
        option("encoding-out", CliOptionType::STRING, "Output encoding"),
        option("newline-out", CliOptionType::STRING, "CRLF or LF"),
        option("on-missing-order", CliOptionType::STRING, "fill or error"),
        option("report", CliOptionType::STRING, "Root-relative issue report path"),
        option("delimiter", CliOptionType::STRING, "Dialect delimiter override (',', ';', 'tab')"),
        option("quotechar", CliOptionType::STRING, "Dialect quote character override"),
        option("has-header", CliOptionType::BOOLEAN, "Dialect header override"),
        option("backup", CliOptionType::BOOLEAN, "Back up an existing target", "true"),
        option("overwrite", CliOptionType::BOOLEAN, "Replace an existing target", "true"),
        option("rows", CliOptionType::STRING, "JSON file holding an array of row objects (export)"),
        option("columns", CliOptionType::STRING_LIST, "Export columns, comma-separated"),
        option("quote-all", CliOptionType::BOOLEAN, "Quote every exported field"),
        option("excel-formula", CliOptionType::STRING_LIST, "Columns written as =\"value\""),
        option("sanitize", CliOptionType::BOOLEAN, "Replace CR, LF and TAB with spaces on export"),
        option("subpath", CliOptionType::STRING, "Root-relative directory", ""),
        option("pattern", CliOptionType::STRING, "File name pattern for bulk", "*.csv"),
        option("recursive", CliOptionType::BOOLEAN, "Descend into subdirectories"),
        option("output-dir", CliOptionType::STRING, "Bulk output directory"),
        option("out-suffix", CliOptionType::STRING, "Bulk output file suffix"),
        option("report-dir", CliOptionType::STRING, "Bulk report directory, empty to disable"),
        option("dry-run", CliOptionType::BOOLEAN, "List matched files only"),
        option("fail-fast", CliOptionType::BOOLEAN, "Stop at the first failed file"),
        option("require-matches", CliOptionType::BOOLEAN, "Fail when nothing matches"),
        option("ext", CliOptionType::STRING_LIST, "Extensions filter for files-list"),
        option("limit", CliOptionType::INTEGER, "Maximum listed files", "200"),
        option("mode", CliOptionType::STRING, "files-read mode: text or head", "text"),
        option("max-bytes", CliOptionType::INTEGER, "files-read head size", "65536"),
        option("text", CliOptionType::STRING, "Text for files-write"),
        option("text-file", CliOptionType::STRING, "Local file whose content files-write stores"),
    });
    return parser;
}

std::string requireString(const CliParseResult& args, const std::string& name) {
    auto value = args.getOptionalString(name);
    if (!value || value->empty()) {
        throw InvalidArgumentError("missing required option --" + name);
    }
    return *value;
}

char parseCharOption(const std::string& name, const std::string& value) {
    if (value == "tab" || value == "\\t") {
        return '\t';
    }
    if (value.size() != 1) {
        throw InvalidArgumentError("--" + name + " expects a single character, got: " + value);
    }
    return value[0];
}

std::size_t positiveInt(const CliParseResult& args, const std::string& name) {
    auto value = args.getInt(name);
    if (!value || *value <= 0) {
        throw InvalidArgumentError("--" + name + " must be a positive integer");
    }
    return static_cast<std::size_t>(*value);
}

// EN: Collect explicit caller overrides: the --overrides document first, then individual flags.
// FR: Rassemble les surcharges explicites : le document --overrides d'abord, puis les options individuelles.
Preset::PresetFields collectOverrides(const CliParseResult& args) {
    Preset::PresetFields fields;
    if (auto file = args.getOptionalString("overrides")) {
        fields = Preset::PresetStore::parse("overrides", FS::readFileBytes(*file)).fields;
    }

    if (args.has("map")) {
        CSV::HeaderMap header_map = fields.header_map.value_or(CSV::HeaderMap{});
        for (const auto& entry : args.getList("map")) {
            const auto equals = entry.find('=');
            if (equals == std::string::npos || equals == 0) {
                throw InvalidArgumentError("--map expects raw=canonical, got: " + entry);
            }
            header_map[entry.substr(0, equals)] = entry.substr(equals + 1);
        }
        fields.header_map = header_map;
    }
    if (args.has("required")) fields.required_headers = args.getList("required");
    if (args.has("order")) fields.order = args.getList("order");
    if (args.has("trim")) fields.trim_whitespace = args.getFlag("trim");
    if (args.has("drop-empty")) fields.drop_empty_rows = args.getFlag("drop-empty");
    if (auto value = args.getOptionalString("encoding-in")) fields.encoding_in = *value;
    if (auto value = args.getOptionalString("encoding-out")) fields.encoding_out = *value;
    if (auto value = args.getOptionalString("newline-out")) fields.newline_out = *value;
    if (auto value = args.getOptionalString("on-missing-order")) {
        fields.on_missing_order_column = Preset::parseMissingColumnPolicy(*value);
        if (!fields.on_missing_order_column) {
            throw InvalidArgumentError("--on-missing-order must be fill or error, got: " + *value);
        }
    }
    return fields;
}

Engine::KeyedRow rowFromJson(const nlohmann::ordered_json& object) {
    if (!object.is_object()) {
        throw InvalidArgumentError("export rows must be JSON objects");
    }
    Engine::KeyedRow row;
    for (const auto& [key, value] : object.items()) {
        if (value.is_null()) {
            row.emplace_back(key, "");
        } else if (value.is_string()) {
            row.emplace_back(key, value.get<std::string>());
        } else {
            row.emplace_back(key, value.dump());
        }
    }
    return row;
}

int runInspect(const Engine::CsvEngine& engine, const CliParseResult& args) {
    printJson(engine.inspect(requireString(args, "input"), positiveInt(args, "sample-rows")).toJson());
    return EXIT_OK;
}

int runNormalize(const Engine::CsvEngine& engine, const CliParseResult& args) {
    Engine::NormalizeRequest request;
    request.input = requireString(args, "input");
    request.output = requireString(args, "output");
    request.preset = args.getOptionalString("preset");
    request.overrides = collectOverrides(args);
    request.report = args.getOptionalString("report");
    request.backup = args.getFlag("backup", true);
    request.overwrite = args.getFlag("overwrite", true);
    if (auto value = args.getOptionalString("delimiter")) request.delimiter = parseCharOption("delimiter", *value);
    if (auto value = args.getOptionalString("quotechar")) request.quote_char = parseCharOption("quotechar", *value);
    if (args.has("has-header")) request.has_header = args.getFlag("has-header");

    printJson(engine.normalize(request).toJson());
    return EXIT_OK;
}

int runExport(const Engine::CsvEngine& engine, const CliParseResult& args) {
    Engine::ExportRequest request;
    request.output = requireString(args, "output");

    const std::string rows_file = requireString(args, "rows");
    nlohmann::ordered_json rows;
    try {
        rows = nlohmann::ordered_json::parse(FS::readFileBytes(rows_file));
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidArgumentError("invalid rows JSON in " + rows_file + ": " + e.what());
    }
    if (!rows.is_array()) {
        throw InvalidArgumentError("rows JSON must be an array of objects");
    }
    for (const auto& row : rows) {
        request.rows.push_back(rowFromJson(row));
    }

    if (args.has("columns")) request.columns = args.getList("columns");
    request.encoding_out = args.getString("encoding-out", request.encoding_out);
    request.newline_out = args.getString("newline-out", request.newline_out);
    request.quote_all = args.getFlag("quote-all");
    request.excel_formula_columns = args.getList("excel-formula");
    request.sanitize_control_chars = args.getFlag("sanitize");
    request.backup = args.getFlag("backup", true);
    request.overwrite = args.getFlag("overwrite", true);

    printJson(engine.exportRows(request).toJson());
    return EXIT_OK;
}

int runBulk(const Engine::CsvEngine& engine, const CliParseResult& args) {
    Engine::BulkRequest request;
    request.subpath = args.getString("subpath");
    request.pattern = args.getString("pattern", request.pattern);
    request.recursive = args.getFlag("recursive");
    request.output_dir = args.getOptionalString("output-dir");
    request.out_suffix = args.getOptionalString("out-suffix");
    request.report_dir = args.getOptionalString("report-dir");
    request.preset = args.getOptionalString("preset");
    request.overrides = collectOverrides(args);
    request.backup = args.getFlag("backup", true);
    request.overwrite = args.getFlag("overwrite", true);
    request.dry_run = args.getFlag("dry-run");
    request.fail_fast = args.getFlag("fail-fast");
    request.require_matches = args.getFlag("require-matches");

    const Engine::BulkReport report = engine.bulkNormalize(request);
    printJson(report.toJson());
    return report.ok ? EXIT_OK : EXIT_FAILURE_GENERIC;
}

int runPresets(const Engine::CsvEngine& engine, const CliParseResult&) {
    printJson({{"ok", true}, {"presets", engine.listPresets()}});
    return EXIT_OK;
}

int runFilesList(const Engine::CsvEngine& engine, const CliParseResult& args) {
    const FS::FileListing listing = engine.files().list(args.getString("subpath"), args.getList("ext"),
                                                        args.getFlag("recursive"), positiveInt(args, "limit"));
    printJson(listing.toJson());
    return EXIT_OK;
}

int runFilesRead(const Engine::CsvEngine& engine, const CliParseResult& args) {
    const std::string mode_text = args.getString("mode", "text");
    auto mode = FS::parseReadMode(mode_text);
    if (!mode) {
        throw InvalidArgumentError("--mode must be text or head, got: " + mode_text);
    }
    printJson(engine.files().read(requireString(args, "input"), *mode, positiveInt(args, "max-bytes")).toJson());
    return EXIT_OK;
}

int runFilesWrite(const Engine::CsvEngine& engine, const CliParseResult& args) {
    std::string text;
    if (auto file = args.getOptionalString("text-file")) {
        text = FS::readFileBytes(*file);
    } else {
        text = args.getString("text");
    }
    const FS::WriteResult result = engine.files().write(requireString(args, "output"), text,
                                                        args.getFlag("overwrite", true), args.getFlag("backup", true));
    printJson(FS::writeResultToJson(result));
    return EXIT_OK;
}

EngineSettings loadSettings(const CliParseResult& args) {
    ConfigManager& config = ConfigManager::getInstance();
    if (auto file = args.getOptionalString("config")) {
        if (!config.loadFromFile(*file)) {
            throw InvalidArgumentError("cannot load configuration file: " + *file);
        }
    }
    config.loadEnvironmentOverrides("TNORM_");
    CliParser::applyOverrides(args, config);

    config.addValidationRules(EngineSettings::validationRules());
    std::vector<std::string> errors;
    if (!config.validate(errors)) {
        throw EngineError(ErrorCode::INVALID_ARGUMENT, "invalid configuration", "", errors);
    }
    return EngineSettings::fromConfig(config);
}

} // namespace

int main(int argc, char* argv[]) {
    Logger& logger = Logger::getInstance();
    logger.setConsoleSink(Logger::ConsoleSink::STDERR);
    logger.setLogLevel(LogLevel::WARN);

    CliParser parser = buildParser();
    const CliParseResult args = parser.parse(argc, argv);

    if (args.status == CliParseStatus::HELP_REQUESTED) {
        std::cout << args.help_text;
        return EXIT_OK;
    }
    if (args.status == CliParseStatus::VERSION_REQUESTED) {
        std::cout << "tnormctl " << kVersion << std::endl;
        return EXIT_OK;
    }
    if (!args.ok() || args.positionals.size() != 1) {
        for (const auto& error : args.errors) {
            std::cerr << "tnormctl: " << error << std::endl;
        }
        if (args.positionals.size() != 1) {
            std::cerr << "tnormctl: expected exactly one command" << std::endl;
        }
        std::cerr << parser.generateHelpText();
        return EXIT_USAGE;
    }

    using Command = std::function<int(const Engine::CsvEngine&, const CliParseResult&)>;
    static const std::map<std::string, Command> kCommands = {
        {"inspect", runInspect},
        {"normalize", runNormalize},
        {"export", runExport},
        {"bulk", runBulk},
        {"presets", runPresets},
        {"files-list", runFilesList},
        {"files-read", runFilesRead},
        {"files-write", runFilesWrite},
    };

    const std::string& command = args.positionals.front();
    auto it = kCommands.find(command);
    if (it == kCommands.end()) {
        std::cerr << "tnormctl: unknown command: " << command << std::endl;
        return EXIT_USAGE;
    }

    try {
        EngineSettings settings = loadSettings(args);
        logger.setLogLevel(settings.log_level);
        if (!settings.log_file.empty() && !logger.setOutputFile(settings.log_file)) {
            std::cerr << "tnormctl: cannot open log file " << settings.log_file << std::endl;
        }

        const Engine::CsvEngine engine(std::move(settings));
        return it->second(engine, args);
    } catch (const EngineError& e) {
        LOG_ERROR_META("cli", e.what(), {{"command", command}, {"code", errorCodeToString(e.code())}});
        printJson(errorToJson(e));
        return exitCodeForStatus(e.status());
    } catch (const std::exception& e) {
        LOG_ERROR_META("cli", e.what(), {{"command", command}});
        printJson({{"ok", false}, {"error", {{"code", "INTERNAL"}, {"status", 500}, {"message", e.what()}}}});
        return EXIT_FAILURE_GENERIC;
    }
}
