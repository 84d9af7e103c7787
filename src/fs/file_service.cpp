// EN: FileService implementation. Every path goes through the PathGuard before touching the disk.
// FR: Implémentation de FileService. Chaque chemin passe par le PathGuard avant tout accès disque.

#include "tnorm/fs/file_service.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"
#include "tnorm/text/transcoder.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace TNORM::FS {

namespace {

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // namespace

std::optional<ReadMode> parseReadMode(const std::string& text) {
    const std::string lower = toLower(text);
    if (lower == "text") return ReadMode::TEXT;
    if (lower == "head") return ReadMode::HEAD;
    return std::nullopt;
}

nlohmann::json FileListing::toJson() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& item : items) {
        entries.push_back({
            {"rel", item.rel},
            {"name", item.name},
            {"size", item.size},
            {"mtime", item.mtime},
        });
    }
    return {
        {"count", items.size()},
        {"base", base.string()},
        {"items", entries},
    };
}

nlohmann::json FileContent::toJson() const {
    return {
        {"meta", {{"name", meta.path.filename().string()},
                  {"path", meta.path.string()},
                  {"size", meta.size},
                  {"mtime", meta.mtime}}},
        {"text", text},
        {"truncated", truncated},
        {"replacements", replacements},
    };
}

nlohmann::json writeResultToJson(const WriteResult& result) {
    nlohmann::json json = {
        {"ok", true},
        {"path", result.meta.path.string()},
        {"size", result.meta.size},
        {"mtime", result.meta.mtime},
    };
    json["backup_path"] = result.backup_path ? nlohmann::json(result.backup_path->string()) : nlohmann::json(nullptr);
    return json;
}

FileService::FileService(const PathGuard& guard, const AtomicFileWriter& writer)
    : guard_(guard), writer_(writer) {}

std::vector<std::string> FileService::normalizeExtensions(const std::vector<std::string>& extensions) {
    std::vector<std::string> normalized;
    for (const auto& extension : extensions) {
        std::string cleaned = toLower(extension);
        cleaned.erase(std::remove_if(cleaned.begin(), cleaned.end(),
                                     [](unsigned char c) { return std::isspace(c) != 0; }),
                      cleaned.end());
        if (cleaned.empty()) {
            continue;
        }
        if (cleaned.front() != '.') {
            cleaned.insert(cleaned.begin(), '.');
        }
        normalized.push_back(std::move(cleaned));
    }
    return normalized;
}

FileListing FileService::list(const std::string& subpath, const std::vector<std::string>& extensions,
                              bool recursive, std::size_t limit) const {
    FileListing listing;
    listing.base = guard_.resolve(subpath);

    std::error_code ec;
    if (!fs::is_directory(listing.base, ec)) {
        throw InputFileNotFoundError(listing.base.string());
    }

    const std::vector<std::string> suffixes = normalizeExtensions(extensions);

    auto consider = [&](const fs::directory_entry& entry) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            return;
        }
        if (!suffixes.empty()) {
            const std::string suffix = toLower(entry.path().extension().string());
            if (std::find(suffixes.begin(), suffixes.end(), suffix) == suffixes.end()) {
                return;
            }
        }
        auto rooted = guard_.relativeTo(entry.path());
        if (!rooted) {
            return;
        }
        const FileMeta meta = statFile(entry.path());
        listing.items.push_back({rooted->relative.generic_string(), entry.path().filename().string(),
                                 meta.size, meta.mtime});
    };

    if (recursive) {
        fs::recursive_directory_iterator it(listing.base, fs::directory_options::skip_permission_denied, ec);
        for (fs::recursive_directory_iterator end; !ec && it != end && listing.items.size() < limit; it.increment(ec)) {
            consider(*it);
        }
    } else {
        fs::directory_iterator it(listing.base, fs::directory_options::skip_permission_denied, ec);
        for (fs::directory_iterator end; !ec && it != end && listing.items.size() < limit; it.increment(ec)) {
            consider(*it);
        }
    }
    if (ec) {
        throw ReadFailureError(listing.base.string(), ec.message());
    }

    std::sort(listing.items.begin(), listing.items.end(),
              [](const ListedFile& a, const ListedFile& b) { return a.rel < b.rel; });

    LOG_DEBUG_META("files", "Listed directory",
                   {{"base", listing.base.string()}, {"count", std::to_string(listing.items.size())}});
    return listing;
}

FileContent FileService::read(const std::string& relpath, ReadMode mode, std::size_t max_bytes) const {
    const fs::path path = guard_.resolve(relpath);

    FileContent content;
    content.meta = statFile(path);

    std::string bytes;
    if (mode == ReadMode::HEAD) {
        bytes = readFileHead(path, max_bytes);
        content.truncated = bytes.size() < content.meta.size;
    } else {
        bytes = readFileBytes(path);
    }

    if (auto strict = Text::Transcoder::decodeStrict(bytes, "utf-8")) {
        content.text = std::move(*strict);
    } else {
        Text::DecodeResult decoded = Text::Transcoder::decodePermissive(bytes, "utf-8");
        content.text = std::move(decoded.text);
        content.replacements = decoded.replacements;
    }
    return content;
}

WriteResult FileService::write(const std::string& relpath, const std::string& text,
                               bool overwrite, bool backup) const {
    const fs::path path = guard_.resolve(relpath);

    WriteOptions options;
    options.overwrite = overwrite;
    options.backup = backup;
    WriteResult result = writer_.write(path, text, options);

    LOG_INFO_META("files", "File written",
                  {{"path", path.string()}, {"size", std::to_string(result.meta.size)}});
    return result;
}

} // namespace TNORM::FS
