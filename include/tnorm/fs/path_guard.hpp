// EN: Confines every filesystem access of the engine to an allow-list of root directories
// FR: Confine tous les accès fichiers du moteur à une liste de répertoires racines autorisés

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace TNORM::FS {

// EN: Root that contains a path plus the path relative to that root.
// FR: Racine contenant un chemin plus le chemin relatif à cette racine.
struct RootedPath {
    std::filesystem::path root;
    std::filesystem::path relative;
};

class PathGuard {
public:
    // EN: Roots are made absolute and canonical once; order is preserved and decides resolution priority.
    // FR: Les racines sont rendues absolues et canoniques une fois; l'ordre est conservé et fixe la priorité.
    explicit PathGuard(const std::vector<std::filesystem::path>& roots);

    // EN: Resolve a caller path to an absolute path inside the first root that contains it.
    //     Throws RootsNotConfiguredError or PathOutsideAllowedRootsError.
    // FR: Résout un chemin appelant en chemin absolu dans la première racine qui le contient.
    //     Lance RootsNotConfiguredError ou PathOutsideAllowedRootsError.
    std::filesystem::path resolve(const std::string& relative_path) const;

    // EN: One candidate per root that contains the joined path (possibly empty).
    // FR: Un candidat par racine qui contient le chemin joint (éventuellement vide).
    std::vector<std::filesystem::path> resolveAll(const std::string& relative_path) const;

    bool isAllowed(const std::filesystem::path& path) const;

    std::optional<RootedPath> relativeTo(const std::filesystem::path& path) const;

    const std::vector<std::filesystem::path>& roots() const { return roots_; }

    // EN: Remove leading '/', '\' and ':' noise and turn backslashes into separators.
    // FR: Retire le bruit '/', '\' et ':' en tête et convertit les antislashs en séparateurs.
    static std::string stripSeparatorNoise(const std::string& relative_path);

private:
    std::vector<std::filesystem::path> roots_;

    static std::filesystem::path canonicalize(const std::filesystem::path& path);
    static bool contains(const std::filesystem::path& root, const std::filesystem::path& candidate);
    std::optional<std::filesystem::path> absoluteInsideRoot(const std::string& path) const;
};

} // namespace TNORM::FS
