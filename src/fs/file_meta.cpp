// EN: File metadata snapshot (path, size, ISO-8601 mtime)
// FR: Instantané des métadonnées de fichier (chemin, taille, mtime ISO-8601)

#include "tnorm/fs/file_meta.hpp"
#include "tnorm/core/errors.hpp"

#include <sys/stat.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace TNORM::FS {

std::string formatLocalTime(std::time_t time) {
    std::tm local{};
    localtime_r(&time, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

FileMeta statFile(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) {
            throw InputFileNotFoundError(path.string());
        }
        throw ReadFailureError(path.string(), std::strerror(errno));
    }

    FileMeta meta;
    meta.path = path;
    meta.size = static_cast<std::uintmax_t>(st.st_size);
    meta.mtime = formatLocalTime(st.st_mtime);
    return meta;
}

std::string readFileBytes(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw InputFileNotFoundError(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadFailureError(path.string(), "cannot open file");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw ReadFailureError(path.string(), "I/O error while reading");
    }
    return buffer.str();
}

// EN: At most max_bytes; a shorter file returns its whole content.
// FR: Au plus max_bytes; un fichier plus court renvoie tout son contenu.
std::string readFileHead(const std::filesystem::path& path, std::size_t max_bytes) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw InputFileNotFoundError(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadFailureError(path.string(), "cannot open file");
    }
    std::string bytes(max_bytes, '\0');
    file.read(bytes.data(), static_cast<std::streamsize>(max_bytes));
    if (file.bad()) {
        throw ReadFailureError(path.string(), "I/O error while reading");
    }
    bytes.resize(static_cast<std::size_t>(file.gcount()));
    return bytes;
}

} // namespace TNORM::FS
