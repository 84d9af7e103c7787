// EN: Bulk orchestrator implementation. Files are processed sequentially in discovery order.
// FR: Implémentation de l'orchestrateur de masse. Les fichiers sont traités séquentiellement dans l'ordre de découverte.

#include "tnorm/engine/bulk_normalizer.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace TNORM::Engine {

nlohmann::json BulkItem::toJson() const {
    nlohmann::json json;
    json["ok"] = ok;
    json["input"] = input;
    if (ok) {
        json["output"] = output;
        json["issues"] = issues;
        if (report) {
            nlohmann::json report_json = fileMetaToJson(report->meta);
            report_json["issues"] = report->issues;
            report_json["by_rule"] = report->by_rule;
            json["report"] = report_json;
        } else {
            json["report"] = nullptr;
        }
    } else {
        json["error"] = error;
        json["code"] = code ? nlohmann::json(errorCodeToString(*code)) : nlohmann::json(nullptr);
    }
    return json;
}

nlohmann::json BulkReport::toJson() const {
    nlohmann::json json;
    json["ok"] = ok;
    json["matched"] = matched;
    if (dry_run) {
        json["preview"] = preview;
        return json;
    }
    json["succeeded"] = succeeded;
    json["failed"] = failed;
    json["total_issues"] = total_issues;
    nlohmann::json item_list = nlohmann::json::array();
    for (const auto& item : items) {
        item_list.push_back(item.toJson());
    }
    json["items"] = item_list;
    return json;
}

BulkNormalizer::BulkNormalizer(const EngineSettings& settings, const FS::PathGuard& guard,
                               const SingleFileNormalizer& normalizer)
    : settings_(settings), guard_(guard), normalizer_(normalizer) {}

bool BulkNormalizer::matchesPattern(const std::string& file_name, const std::string& pattern) {
    return ::fnmatch(pattern.c_str(), file_name.c_str(), 0) == 0;
}

std::vector<MatchedFile> BulkNormalizer::discover(const std::string& subpath, const std::string& pattern,
                                                  bool recursive) const {
    std::vector<MatchedFile> matches;

    for (const auto& base : guard_.resolveAll(subpath)) {
        std::error_code ec;
        if (!fs::is_directory(base, ec)) {
            continue;
        }

        std::vector<fs::path> found;
        auto consider = [&](const fs::directory_entry& entry) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) {
                return;
            }
            if (matchesPattern(entry.path().filename().string(), pattern) && guard_.isAllowed(entry.path())) {
                found.push_back(entry.path());
            }
        };

        if (recursive) {
            fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
            for (fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
                consider(*it);
            }
        } else {
            fs::directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
            for (fs::directory_iterator end; !ec && it != end; it.increment(ec)) {
                consider(*it);
            }
        }
        if (ec) {
            LOG_WARN_META("bulk", "Directory scan interrupted", {{"base", base.string()}, {"error", ec.message()}});
        }

        std::sort(found.begin(), found.end());
        for (const auto& path : found) {
            auto rooted = guard_.relativeTo(path);
            if (!rooted) {
                continue;
            }
            matches.push_back({rooted->root, path, rooted->relative.generic_string()});
        }
    }

    LOG_DEBUG_META("bulk", "Discovery finished",
                   {{"subpath", subpath}, {"pattern", pattern}, {"matched", std::to_string(matches.size())}});
    return matches;
}

BulkReport BulkNormalizer::run(const BulkRequest& request) const {
    if (guard_.roots().empty()) {
        throw RootsNotConfiguredError();
    }

    const std::vector<MatchedFile> matches = discover(request.subpath, request.pattern, request.recursive);
    if (matches.empty() && request.require_matches) {
        throw NoFilesMatchedError(request.subpath, request.pattern);
    }

    BulkReport report;
    report.matched = matches.size();

    if (request.dry_run) {
        report.dry_run = true;
        for (const auto& match : matches) {
            report.preview.push_back(match.relative);
        }
        return report;
    }

    const std::string output_dir = request.output_dir.value_or(settings_.bulk.output_dir);
    const std::string out_suffix = request.out_suffix.value_or(settings_.bulk.out_suffix);
    const std::string report_dir = request.report_dir.value_or(settings_.bulk.report_dir);

    LOG_INFO_META("bulk", "Bulk normalization started",
                  {{"subpath", request.subpath}, {"pattern", request.pattern},
                   {"matched", std::to_string(matches.size())}, {"output_dir", output_dir}});

    // EN: Preset lookup happens per file; PresetNotFound becomes a failed item.
    // FR: Le preset est résolu par fichier; PresetNotFound devient un élément en échec.
    for (const auto& match : matches) {
        const std::string stem = fs::path(match.relative).stem().string();

        NormalizeRequest file_request;
        // EN: The absolute path pins the input to the root it was discovered under.
        // FR: Le chemin absolu rattache l'entrée à la racine où elle a été découverte.
        file_request.input = match.absolute.string();
        file_request.output = (fs::path(output_dir) / (stem + out_suffix)).generic_string();
        if (!report_dir.empty()) {
            file_request.report = (fs::path(report_dir) / (stem + "__report.csv")).generic_string();
        }
        file_request.preset = request.preset;
        file_request.overrides = request.overrides;
        file_request.backup = request.backup;
        file_request.overwrite = request.overwrite;

        BulkItem item;
        item.input = match.relative;
        try {
            const NormalizeReport result = normalizer_.run(file_request);
            item.ok = true;
            item.output = result.output.path.string();
            item.issues = result.validation.issue_count;
            item.report = result.validation.report;
            report.total_issues += item.issues;
            ++report.succeeded;
        } catch (const EngineError& e) {
            item.ok = false;
            item.error = e.what();
            item.code = e.code();
        } catch (const std::exception& e) {
            item.ok = false;
            item.error = e.what();
        }

        const bool failed = !item.ok;
        if (failed) {
            LOG_WARN_META("bulk", "File failed", {{"input", item.input}, {"error", item.error}});
        }
        report.items.push_back(std::move(item));
        if (failed && request.fail_fast) {
            LOG_INFO("bulk", "Stopping after first failure");
            break;
        }
    }

    report.failed = report.items.size() - report.succeeded;
    report.ok = report.failed == 0;

    LOG_INFO_META("bulk", "Bulk normalization completed",
                  {{"matched", std::to_string(report.matched)},
                   {"succeeded", std::to_string(report.succeeded)},
                   {"failed", std::to_string(report.failed)},
                   {"total_issues", std::to_string(report.total_issues)}});
    return report;
}

} // namespace TNORM::Engine
