// EN: File metadata snapshot (path, size, modification time) and whole-file reads
// FR: Instantané de métadonnées de fichier (chemin, taille, date de modification) et lecture complète

#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace TNORM::FS {

struct FileMeta {
    std::filesystem::path path;
    std::uintmax_t size{0};
    std::string mtime;  // EN: Local time, ISO-8601 to the second / FR: Heure locale, ISO-8601 à la seconde
};

// EN: stat() the file. Throws InputFileNotFoundError when it does not exist.
// FR: stat() du fichier. Lance InputFileNotFoundError s'il n'existe pas.
FileMeta statFile(const std::filesystem::path& path);

// EN: Read the whole file. Throws InputFileNotFoundError or ReadFailureError.
// FR: Lit tout le fichier. Lance InputFileNotFoundError ou ReadFailureError.
std::string readFileBytes(const std::filesystem::path& path);

// EN: Read at most max_bytes from the start of the file.
// FR: Lit au plus max_bytes depuis le début du fichier.
std::string readFileHead(const std::filesystem::path& path, std::size_t max_bytes);

std::string formatLocalTime(std::time_t time);

} // namespace TNORM::FS
