// EN: Error taxonomy implementation
// FR: Implémentation de la taxonomie d'erreurs

#include "tnorm/core/errors.hpp"

namespace TNORM {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::PATH_OUTSIDE_ALLOWED_ROOTS: return "PathOutsideAllowedRoots";
        case ErrorCode::ROOTS_NOT_CONFIGURED:       return "RootsNotConfigured";
        case ErrorCode::INPUT_FILE_NOT_FOUND:       return "InputFileNotFound";
        case ErrorCode::PRESET_NOT_FOUND:           return "PresetNotFound";
        case ErrorCode::PRESET_LOAD_ERROR:          return "PresetLoadError";
        case ErrorCode::MISSING_REQUIRED_HEADERS:   return "MissingRequiredHeaders";
        case ErrorCode::MISSING_ORDER_COLUMNS:      return "MissingOrderColumns";
        case ErrorCode::OUTPUT_EXISTS:              return "OutputExists";
        case ErrorCode::READ_FAILURE:               return "ReadFailure";
        case ErrorCode::WRITE_FAILURE:              return "WriteFailure";
        case ErrorCode::INVALID_ARGUMENT:           return "InvalidArgument";
        case ErrorCode::NO_FILES_MATCHED:           return "NoFilesMatched";
        default:                                    return "Unknown";
    }
}

int errorCodeToStatus(ErrorCode code) {
    switch (code) {
        case ErrorCode::PATH_OUTSIDE_ALLOWED_ROOTS:
            return 403;
        case ErrorCode::INPUT_FILE_NOT_FOUND:
        case ErrorCode::PRESET_NOT_FOUND:
        case ErrorCode::NO_FILES_MATCHED:
            return 404;
        case ErrorCode::OUTPUT_EXISTS:
            return 409;
        case ErrorCode::MISSING_REQUIRED_HEADERS:
        case ErrorCode::MISSING_ORDER_COLUMNS:
            return 422;
        case ErrorCode::INVALID_ARGUMENT:
            return 400;
        default:
            return 500;
    }
}

EngineError::EngineError(ErrorCode code, const std::string& message, std::string path,
                         std::vector<std::string> details)
    : std::runtime_error(message), code_(code), path_(std::move(path)), details_(std::move(details)) {}

namespace {

std::string joinNames(const std::string& prefix, const std::vector<std::string>& names) {
    std::string message = prefix;
    for (size_t i = 0; i < names.size(); ++i) {
        message += (i == 0 ? " " : ", ") + names[i];
    }
    return message;
}

} // namespace

MissingRequiredHeadersError::MissingRequiredHeadersError(const std::string& path,
                                                         const std::vector<std::string>& missing)
    : EngineError(ErrorCode::MISSING_REQUIRED_HEADERS, joinNames("Missing required headers:", missing), path,
                  missing) {}

MissingOrderColumnsError::MissingOrderColumnsError(const std::string& path, const std::vector<std::string>& missing)
    : EngineError(ErrorCode::MISSING_ORDER_COLUMNS, joinNames("Output order names absent columns:", missing), path,
                  missing) {}

} // namespace TNORM
