// EN: Confined file listing, reading and writing under the allowed roots
// FR: Listage, lecture et écriture de fichiers confinés aux racines autorisées

#pragma once

#include "tnorm/fs/atomic_file_writer.hpp"
#include "tnorm/fs/file_meta.hpp"
#include "tnorm/fs/path_guard.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace TNORM::FS {

enum class ReadMode {
    TEXT,  // EN: Whole file as UTF-8 text / FR: Fichier entier en texte UTF-8
    HEAD   // EN: First max_bytes as UTF-8 text / FR: Premiers max_bytes en texte UTF-8
};

std::optional<ReadMode> parseReadMode(const std::string& text);

struct ListedFile {
    std::string rel;   // EN: Path relative to its root / FR: Chemin relatif à sa racine
    std::string name;
    std::uintmax_t size{0};
    std::string mtime;
};

struct FileListing {
    std::filesystem::path base;
    std::vector<ListedFile> items;

    nlohmann::json toJson() const;
};

struct FileContent {
    FileMeta meta;
    std::string text;
    bool truncated = false;
    std::size_t replacements{0};  // EN: Invalid UTF-8 bytes shown as U+FFFD / FR: Octets UTF-8 invalides affichés en U+FFFD

    nlohmann::json toJson() const;
};

class FileService {
public:
    static constexpr std::size_t kDefaultListLimit = 200;
    static constexpr std::size_t kDefaultMaxBytes = 65536;

    FileService(const PathGuard& guard, const AtomicFileWriter& writer);

    // EN: Regular files under subpath, filtered by case-insensitive extension (".csv" or "csv").
    // FR: Fichiers réguliers sous subpath, filtrés par extension insensible à la casse (".csv" ou "csv").
    FileListing list(const std::string& subpath, const std::vector<std::string>& extensions = {},
                     bool recursive = false, std::size_t limit = kDefaultListLimit) const;

    FileContent read(const std::string& relpath, ReadMode mode = ReadMode::TEXT,
                     std::size_t max_bytes = kDefaultMaxBytes) const;

    // EN: Write UTF-8 text atomically with the same backup discipline as normalized outputs.
    // FR: Écrit du texte UTF-8 de façon atomique avec la même discipline de sauvegarde que les sorties normalisées.
    WriteResult write(const std::string& relpath, const std::string& text,
                      bool overwrite = true, bool backup = true) const;

    static std::vector<std::string> normalizeExtensions(const std::vector<std::string>& extensions);

private:
    const PathGuard& guard_;
    const AtomicFileWriter& writer_;
};

nlohmann::json writeResultToJson(const WriteResult& result);

} // namespace TNORM::FS
