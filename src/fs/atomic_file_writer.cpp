// EN: Implementation of the atomic file writer
// FR: Implémentation de l'écrivain de fichier atomique

#include "tnorm/fs/atomic_file_writer.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace TNORM::FS {

namespace {

// EN: Removes the temp file on scope exit unless released after a successful rename.
// FR: Supprime le fichier temporaire en sortie de portée sauf s'il est libéré après un renommage réussi.
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void release() { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

// EN: Closes a POSIX descriptor on scope exit.
// FR: Ferme un descripteur POSIX en sortie de portée.
class FdCloser {
public:
    explicit FdCloser(int fd) : fd_(fd) {}
    ~FdCloser() {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    FdCloser(const FdCloser&) = delete;
    FdCloser& operator=(const FdCloser&) = delete;

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

private:
    int fd_;
};

std::string errnoMessage(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

} // namespace

AtomicFileWriter::AtomicFileWriter(const PathGuard& guard) : guard_(guard) {}

fs::path AtomicFileWriter::backupPathFor(const fs::path& target, std::chrono::system_clock::time_point now) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream stamp;
    stamp << std::put_time(&local, "%Y%m%d_%H%M%S");

    const std::string base = target.filename().string() + "__" + stamp.str();
    fs::path candidate = target.parent_path() / (base + ".bak");

    std::error_code ec;
    for (int suffix = 1; fs::exists(candidate, ec); ++suffix) {
        candidate = target.parent_path() / (base + "_" + std::to_string(suffix) + ".bak");
    }
    return candidate;
}

fs::path AtomicFileWriter::tempPathFor(const fs::path& target) {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> distribution(0, 0xFFFFFF);

    std::ostringstream name;
    name << target.filename().string() << ".tmp." << ::getpid() << "." << std::hex << std::setw(6)
         << std::setfill('0') << distribution(generator);
    return target.parent_path() / name.str();
}

WriteResult AtomicFileWriter::write(const fs::path& target, std::string_view bytes,
                                    const WriteOptions& options) const {
    if (!guard_.isAllowed(target)) {
        throw PathOutsideAllowedRootsError(target.string());
    }

    std::error_code ec;
    const fs::path directory = target.parent_path();
    if (!directory.empty()) {
        fs::create_directories(directory, ec);
        if (ec) {
            throw WriteFailureError(target.string(), "cannot create directory " + directory.string() + ": " + ec.message());
        }
    }

    const bool exists = fs::exists(target, ec);
    if (exists && !options.overwrite) {
        throw OutputExistsError(target.string());
    }

    WriteResult result;
    if (exists && options.backup) {
        result.backup_path = createBackup(target);
    }

    const fs::path temp_path = tempPathFor(target);
    TempFileGuard temp_guard(temp_path);

    writeAndSync(temp_path, bytes);

    if (before_rename_hook_) {
        before_rename_hook_(temp_path);
    }

    if (::rename(temp_path.c_str(), target.c_str()) != 0) {
        throw WriteFailureError(target.string(), errnoMessage("rename failed"));
    }
    temp_guard.release();

    syncDirectory(directory.empty() ? fs::path(".") : directory);

    result.meta = statFile(target);
    LOG_DEBUG_META("atomic_writer", "File written",
                   {{"path", target.string()}, {"size", std::to_string(result.meta.size)}});
    return result;
}

// EN: A failed backup copy aborts the write before the target is touched.
// FR: Une copie de sauvegarde échouée annule l'écriture avant toute modification de la cible.
fs::path AtomicFileWriter::createBackup(const fs::path& target) const {
    const fs::path backup_path = backupPathFor(target, std::chrono::system_clock::now());

    std::error_code ec;
    fs::copy_file(target, backup_path, fs::copy_options::none, ec);
    if (ec) {
        throw WriteFailureError(target.string(), "backup copy failed: " + ec.message());
    }

    // EN: Keep the original modification time on the copy.
    // FR: Conserve la date de modification d'origine sur la copie.
    const auto mtime = fs::last_write_time(target, ec);
    if (!ec) {
        fs::last_write_time(backup_path, mtime, ec);
    }

    LOG_INFO_META("atomic_writer", "Backup created", {{"path", target.string()}, {"backup", backup_path.string()}});
    return backup_path;
}

void AtomicFileWriter::writeAndSync(const fs::path& temp_path, std::string_view bytes) {
    const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
    if (fd < 0) {
        throw WriteFailureError(temp_path.string(), errnoMessage("cannot create temp file"));
    }
    FdCloser closer(fd);

    const char* data = bytes.data();
    std::size_t remaining = bytes.size();
    while (remaining > 0) {
        const ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw WriteFailureError(temp_path.string(), errnoMessage("write failed"));
        }
        data += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) != 0) {
        throw WriteFailureError(temp_path.string(), errnoMessage("fsync failed"));
    }
    if (::close(closer.release()) != 0) {
        throw WriteFailureError(temp_path.string(), errnoMessage("close failed"));
    }
}

void AtomicFileWriter::syncDirectory(const fs::path& directory) {
    const int fd = ::open(directory.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) {
        LOG_WARN_META("atomic_writer", "Directory open for fsync failed", {{"path", directory.string()}});
        return;
    }
    FdCloser closer(fd);
    if (::fsync(fd) != 0) {
        LOG_WARN_META("atomic_writer", "Directory fsync failed", {{"path", directory.string()}});
    }
}

} // namespace TNORM::FS
