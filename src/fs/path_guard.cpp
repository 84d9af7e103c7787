// EN: PathGuard implementation. Containment is checked component by component on canonical paths.
// FR: Implémentation de PathGuard. L'inclusion est vérifiée composant par composant sur des chemins canoniques.

#include "tnorm/fs/path_guard.hpp"
#include "tnorm/core/errors.hpp"
#include "tnorm/infrastructure/logging/logger.hpp"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace TNORM::FS {

namespace {

// EN: An absolute input is an escape attempt when it climbs with ".." or starts with a top-level entry that
//     exists on this machine ("/etc/passwd", "/tmp/..."). Otherwise ("/in/a.csv") the leading '/' is noise.
// FR: Une entrée absolue est une tentative d'évasion si elle remonte par ".." ou commence par une entrée de
//     premier niveau existante ("/etc/passwd", "/tmp/..."). Sinon ("/in/a.csv") le '/' initial est du bruit.
bool isAbsoluteEscape(const std::string& path) {
    const fs::path input(path);
    if (!input.is_absolute()) {
        return false;
    }
    for (const auto& part : input) {
        if (part == "..") {
            return true;
        }
    }
    const fs::path relative = input.relative_path();
    if (relative.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::exists(input.root_path() / *relative.begin(), ec);
}

} // namespace

PathGuard::PathGuard(const std::vector<fs::path>& roots) {
    roots_.reserve(roots.size());
    for (const auto& root : roots) {
        if (root.empty()) {
            continue;
        }
        fs::path canonical = canonicalize(root);
        if (std::find(roots_.begin(), roots_.end(), canonical) == roots_.end()) {
            roots_.push_back(std::move(canonical));
        }
    }
}

std::string PathGuard::stripSeparatorNoise(const std::string& relative_path) {
    std::string cleaned = relative_path;
    std::replace(cleaned.begin(), cleaned.end(), '\\', '/');
    const size_t first = cleaned.find_first_not_of(":/");
    return first == std::string::npos ? std::string() : cleaned.substr(first);
}

fs::path PathGuard::resolve(const std::string& relative_path) const {
    if (roots_.empty()) {
        throw RootsNotConfiguredError();
    }

    if (auto absolute = absoluteInsideRoot(relative_path)) {
        return *absolute;
    }
    if (isAbsoluteEscape(relative_path)) {
        LOG_WARN_META("path_guard", "Rejected absolute path outside allowed roots", {{"path", relative_path}});
        throw PathOutsideAllowedRootsError(relative_path);
    }

    const std::string cleaned = stripSeparatorNoise(relative_path);
    for (const auto& root : roots_) {
        fs::path candidate = canonicalize(root / cleaned);
        if (contains(root, candidate)) {
            return candidate;
        }
    }

    LOG_WARN_META("path_guard", "Rejected path outside allowed roots", {{"path", relative_path}});
    throw PathOutsideAllowedRootsError(relative_path);
}

std::vector<fs::path> PathGuard::resolveAll(const std::string& relative_path) const {
    if (roots_.empty()) {
        throw RootsNotConfiguredError();
    }

    std::vector<fs::path> candidates;
    if (auto absolute = absoluteInsideRoot(relative_path)) {
        candidates.push_back(*absolute);
        return candidates;
    }
    if (isAbsoluteEscape(relative_path)) {
        return candidates;
    }

    const std::string cleaned = stripSeparatorNoise(relative_path);
    for (const auto& root : roots_) {
        fs::path candidate = canonicalize(root / cleaned);
        if (contains(root, candidate) &&
            std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
            candidates.push_back(std::move(candidate));
        }
    }
    return candidates;
}

bool PathGuard::isAllowed(const fs::path& path) const {
    return relativeTo(path).has_value();
}

std::optional<RootedPath> PathGuard::relativeTo(const fs::path& path) const {
    if (path.empty()) {
        return std::nullopt;
    }
    const fs::path canonical = canonicalize(path);
    for (const auto& root : roots_) {
        if (contains(root, canonical)) {
            return RootedPath{root, canonical.lexically_relative(root)};
        }
    }
    return std::nullopt;
}

std::optional<fs::path> PathGuard::absoluteInsideRoot(const std::string& path) const {
    const fs::path input(path);
    if (!input.is_absolute()) {
        return std::nullopt;
    }
    fs::path canonical = canonicalize(input);
    for (const auto& root : roots_) {
        if (contains(root, canonical)) {
            return canonical;
        }
    }
    return std::nullopt;
}

// EN: weakly_canonical resolves symlinks of the existing prefix and folds "." and ".." lexically for the rest.
// FR: weakly_canonical résout les liens symboliques du préfixe existant et replie "." et ".." pour le reste.
fs::path PathGuard::canonicalize(const fs::path& path) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    fs::path canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        canonical = absolute.lexically_normal();
    }
    // EN: Drop a trailing separator so "root/" and "root" compare equal.
    // FR: Retire un séparateur final pour que "root/" et "root" soient égaux.
    if (!canonical.has_filename() && canonical.has_parent_path() && canonical != canonical.root_path()) {
        canonical = canonical.parent_path();
    }
    return canonical;
}

bool PathGuard::contains(const fs::path& root, const fs::path& candidate) {
    auto root_it = root.begin();
    auto candidate_it = candidate.begin();
    for (; root_it != root.end(); ++root_it, ++candidate_it) {
        if (candidate_it == candidate.end() || *root_it != *candidate_it) {
            return false;
        }
    }
    return true;
}

} // namespace TNORM::FS
