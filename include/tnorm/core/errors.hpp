// EN: Error taxonomy for the TabNorm engine - typed exceptions carrying a code, an HTTP-class status and details
// FR: Taxonomie d'erreurs du moteur TabNorm - exceptions typées avec code, statut de classe HTTP et détails

#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace TNORM {

// EN: Engine error codes
// FR: Codes d'erreur du moteur
enum class ErrorCode {
    PATH_OUTSIDE_ALLOWED_ROOTS,    // EN: Path resolves outside every allowed root / FR: Chemin hors de toutes les racines autorisées
    ROOTS_NOT_CONFIGURED,          // EN: No allowed root configured / FR: Aucune racine autorisée configurée
    INPUT_FILE_NOT_FOUND,          // EN: Input file absent / FR: Fichier d'entrée absent
    PRESET_NOT_FOUND,              // EN: Named preset absent / FR: Preset nommé absent
    PRESET_LOAD_ERROR,             // EN: Preset file unreadable or malformed / FR: Fichier preset illisible ou malformé
    MISSING_REQUIRED_HEADERS,      // EN: Required headers missing after mapping / FR: En-têtes requis manquants après mapping
    MISSING_ORDER_COLUMNS,         // EN: Output order names absent columns (strict policy) / FR: Colonnes de sortie absentes (politique stricte)
    OUTPUT_EXISTS,                 // EN: Target exists and overwrite disabled / FR: Cible existante et écrasement désactivé
    READ_FAILURE,                  // EN: Input could not be read / FR: Entrée illisible
    WRITE_FAILURE,                 // EN: Disk full, permission denied, backup failure / FR: Disque plein, permission refusée, échec de sauvegarde
    INVALID_ARGUMENT,              // EN: Bad option value / FR: Valeur d'option invalide
    NO_FILES_MATCHED               // EN: Bulk discovery matched nothing when required / FR: Aucun fichier trouvé alors que requis
};

// EN: Convert error code to its stable string form
// FR: Convertit le code d'erreur en sa forme chaîne stable
std::string errorCodeToString(ErrorCode code);

// EN: HTTP-class status associated with an error code (403, 404, 409, 422, 400, 500)
// FR: Statut de classe HTTP associé à un code d'erreur (403, 404, 409, 422, 400, 500)
int errorCodeToStatus(ErrorCode code);

// EN: Base class of every engine failure
// FR: Classe de base de tous les échecs du moteur
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCode code, const std::string& message, std::string path = "",
                std::vector<std::string> details = {});

    ErrorCode code() const { return code_; }
    int status() const { return errorCodeToStatus(code_); }
    const std::string& path() const { return path_; }
    const std::vector<std::string>& details() const { return details_; }

private:
    ErrorCode code_;
    std::string path_;
    std::vector<std::string> details_;
};

class PathOutsideAllowedRootsError : public EngineError {
public:
    explicit PathOutsideAllowedRootsError(const std::string& path)
        : EngineError(ErrorCode::PATH_OUTSIDE_ALLOWED_ROOTS, "Path is outside allowed roots: " + path, path) {}
};

class RootsNotConfiguredError : public EngineError {
public:
    RootsNotConfiguredError()
        : EngineError(ErrorCode::ROOTS_NOT_CONFIGURED, "No allowed roots configured") {}
};

class InputFileNotFoundError : public EngineError {
public:
    explicit InputFileNotFoundError(const std::string& path)
        : EngineError(ErrorCode::INPUT_FILE_NOT_FOUND, "File not found: " + path, path) {}
};

class PresetNotFoundError : public EngineError {
public:
    explicit PresetNotFoundError(const std::string& name)
        : EngineError(ErrorCode::PRESET_NOT_FOUND, "Preset not found: " + name, "", {name}) {}
};

// EN: Carries the missing header names verbatim so callers can fix the source or the header map
// FR: Transporte les noms d'en-têtes manquants tels quels pour corriger la source ou le mapping
class MissingRequiredHeadersError : public EngineError {
public:
    MissingRequiredHeadersError(const std::string& path, const std::vector<std::string>& missing);
    const std::vector<std::string>& missing() const { return details(); }
};

class PresetLoadError : public EngineError {
public:
    PresetLoadError(const std::string& name, const std::string& reason)
        : EngineError(ErrorCode::PRESET_LOAD_ERROR, "Preset load failed: " + name + ": " + reason, "", {name}) {}
};

class MissingOrderColumnsError : public EngineError {
public:
    MissingOrderColumnsError(const std::string& path, const std::vector<std::string>& missing);
    const std::vector<std::string>& missing() const { return details(); }
};

class OutputExistsError : public EngineError {
public:
    explicit OutputExistsError(const std::string& path)
        : EngineError(ErrorCode::OUTPUT_EXISTS, "File exists and overwrite is disabled: " + path, path) {}
};

class ReadFailureError : public EngineError {
public:
    ReadFailureError(const std::string& path, const std::string& reason)
        : EngineError(ErrorCode::READ_FAILURE, "Read failed for " + path + ": " + reason, path) {}
};

class WriteFailureError : public EngineError {
public:
    WriteFailureError(const std::string& path, const std::string& reason)
        : EngineError(ErrorCode::WRITE_FAILURE, "Write failed for " + path + ": " + reason, path) {}
};

class InvalidArgumentError : public EngineError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : EngineError(ErrorCode::INVALID_ARGUMENT, message) {}
};

class NoFilesMatchedError : public EngineError {
public:
    NoFilesMatchedError(const std::string& subpath, const std::string& pattern)
        : EngineError(ErrorCode::NO_FILES_MATCHED, "No files matched " + pattern + " under " + subpath, subpath) {}
};

} // namespace TNORM
