// EN: JSON serialization of normalize, bulk and inspect reports
// FR: Sérialisation JSON des rapports de normalisation, de lot et d'inspection

#include "tnorm/engine/normalize_report.hpp"

namespace TNORM::Engine {

std::string delimiterToString(char delimiter) {
    return std::string(1, delimiter);
}

nlohmann::json fileMetaToJson(const FS::FileMeta& meta) {
    return {
        {"path", meta.path.string()},
        {"size", meta.size},
        {"mtime", meta.mtime},
    };
}

// EN: A missing value serializes as null, an empty one as "".
// FR: Une valeur absente est sérialisée en null, une valeur vide en "".
nlohmann::json issueToJson(const CSV::Issue& issue) {
    nlohmann::json json = {
        {"row", issue.row},
        {"column", issue.column},
        {"rule", issue.rule},
        {"message", issue.message},
    };
    json["value"] = issue.value ? nlohmann::json(*issue.value) : nlohmann::json(nullptr);
    return json;
}

nlohmann::json NormalizeReport::toJson() const {
    nlohmann::json io = {
        {"in_path", input_path},
        {"out_path", output.path.string()},
        {"in_encoding", input_encoding},
        {"out_encoding", output_encoding},
        {"in_newline", Text::newlineToString(input_newline)},
        {"out_newline", Text::newlineToString(output_newline)},
        {"rows_in", rows_in},
        {"rows_out", rows_out},
        {"out_size", output.size},
        {"out_mtime", output.mtime},
    };
    io["backup_path"] = backup_path ? nlohmann::json(*backup_path) : nlohmann::json(nullptr);

    nlohmann::json validation_json = {
        {"issues", validation.issue_count},
        {"by_rule", validation.by_rule},
    };
    nlohmann::json issue_list = nlohmann::json::array();
    for (const auto& issue : validation.issues) {
        issue_list.push_back(issueToJson(issue));
    }
    validation_json["items"] = issue_list;
    if (validation.report) {
        nlohmann::json report_json = fileMetaToJson(validation.report->meta);
        report_json["issues"] = validation.report->issues;
        report_json["by_rule"] = validation.report->by_rule;
        validation_json["report"] = report_json;
    } else {
        validation_json["report"] = nullptr;
    }

    nlohmann::json json;
    json["ok"] = true;
    json["preset"] = preset ? nlohmann::json(*preset) : nlohmann::json(nullptr);
    json["io"] = io;
    json["dialect"] = {
        {"delimiter", delimiterToString(dialect.delimiter)},
        {"quotechar", std::string(1, dialect.quote_char)},
        {"has_header", dialect.has_header},
    };
    json["headers"] = {
        {"raw", raw_headers},
        {"in_normalized", normalized_headers},
        {"mapped", mapped_headers},
        {"out", output_headers},
    };
    json["validation"] = validation_json;
    json["warnings"] = warnings;
    return json;
}

} // namespace TNORM::Engine
