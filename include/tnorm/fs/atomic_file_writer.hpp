// EN: Atomic file writer - temp file in the target directory, fsync, rename, directory fsync, timestamped backup
// FR: Écrivain de fichier atomique - fichier temporaire dans le répertoire cible, fsync, renommage, fsync du répertoire, sauvegarde horodatée

#pragma once

#include "tnorm/fs/file_meta.hpp"
#include "tnorm/fs/path_guard.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string_view>

namespace TNORM::FS {

struct WriteOptions {
    bool backup = true;     // EN: Copy an existing target aside first / FR: Copie d'abord une cible existante
    bool overwrite = true;  // EN: Replace an existing target / FR: Remplace une cible existante
};

struct WriteResult {
    FileMeta meta;
    std::optional<std::filesystem::path> backup_path;
};

class AtomicFileWriter {
public:
    // EN: Called with the temp file path after fsync and before rename. Throwing aborts the write.
    // FR: Appelé avec le chemin temporaire après fsync et avant renommage. Une exception annule l'écriture.
    using BeforeRenameHook = std::function<void(const std::filesystem::path& temp_path)>;

    explicit AtomicFileWriter(const PathGuard& guard);

    // EN: Readers see either the old content or the complete new content, never a partial file.
    //     Throws PathOutsideAllowedRootsError, OutputExistsError or WriteFailureError.
    // FR: Les lecteurs voient l'ancien contenu ou le nouveau complet, jamais un fichier partiel.
    //     Lance PathOutsideAllowedRootsError, OutputExistsError ou WriteFailureError.
    WriteResult write(const std::filesystem::path& target, std::string_view bytes,
                      const WriteOptions& options = WriteOptions{}) const;

    void setBeforeRenameHook(BeforeRenameHook hook) { before_rename_hook_ = std::move(hook); }

    // EN: <name>__YYYYMMDD_HHMMSS.bak beside the target, with _1, _2... appended on collision.
    // FR: <nom>__AAAAMMJJ_HHMMSS.bak à côté de la cible, suffixé _1, _2... en cas de collision.
    static std::filesystem::path backupPathFor(const std::filesystem::path& target,
                                               std::chrono::system_clock::time_point now);

    // EN: <name>.tmp.<pid>.<random hex> beside the target.
    // FR: <nom>.tmp.<pid>.<hex aléatoire> à côté de la cible.
    static std::filesystem::path tempPathFor(const std::filesystem::path& target);

private:
    const PathGuard& guard_;
    BeforeRenameHook before_rename_hook_;

    std::filesystem::path createBackup(const std::filesystem::path& target) const;
    static void writeAndSync(const std::filesystem::path& temp_path, std::string_view bytes);
    static void syncDirectory(const std::filesystem::path& directory);
};

} // namespace TNORM::FS
