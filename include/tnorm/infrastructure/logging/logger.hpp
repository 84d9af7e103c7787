// EN: Process-wide NDJSON logger. One JSON object per line, fields in insertion order.
// FR: Logger NDJSON global au processus. Un objet JSON par ligne, champs dans l'ordre d'insertion.

#pragma once

#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TNORM {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

// EN: Parse "debug" / "info" / "warn" / "error" (case-insensitive, "warning" accepted).
// FR: Analyse "debug" / "info" / "warn" / "error" (insensible à la casse, "warning" accepté).
std::optional<LogLevel> parseLogLevel(const std::string& text);

// EN: Extra key/value pairs attached to a log line, written after the reserved fields.
// FR: Paires clé/valeur supplémentaires d'une ligne de log, écrites après les champs réservés.
using LogFields = std::vector<std::pair<std::string, std::string>>;

class Logger {
public:
    struct LogEntry {
        std::chrono::system_clock::time_point timestamp;
        LogLevel level = LogLevel::INFO;
        std::string module;
        std::string message;
        std::string correlation_id;
        std::string thread_id;
        LogFields fields;
    };

    // EN: The CLI keeps stdout for JSON results and sends logs to stderr.
    // FR: La CLI garde stdout pour les résultats JSON et envoie les logs sur stderr.
    enum class ConsoleSink {
        STDOUT,
        STDERR,
        NONE
    };

    static Logger& getInstance();

    void setLogLevel(LogLevel level);
    LogLevel getLogLevel() const;
    bool isEnabled(LogLevel level) const;

    // EN: Append to filename instead of the console. An empty name closes the file and keeps the console sink.
    // FR: Ajoute au fichier au lieu de la console. Un nom vide ferme le fichier et conserve la sortie console.
    bool setOutputFile(const std::string& filename);
    void setConsoleSink(ConsoleSink sink);

    void setCorrelationId(const std::string& correlation_id);
    std::string getCorrelationId() const;

    // EN: 36-character random identifier, 8-4-4-4-12 hex groups.
    // FR: Identifiant aléatoire de 36 caractères, groupes hexadécimaux 8-4-4-4-12.
    static std::string generateCorrelationId();

    void log(LogLevel level, const std::string& module, const std::string& message, const LogFields& fields = {});

    void flush();

    static std::string formatAsNDJSON(const LogEntry& entry);
    static std::string levelToString(LogLevel level);

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(const std::string& line);

    LogLevel level_ = LogLevel::INFO;
    std::string correlation_id_;
    std::unique_ptr<std::ofstream> file_;
    ConsoleSink console_ = ConsoleSink::STDOUT;
    mutable std::mutex mutex_;
};

// EN: Sets a fresh correlation id for its lifetime and restores the previous one afterwards.
// FR: Pose un nouvel id de corrélation pour sa durée de vie puis restaure le précédent.
class CorrelationScope {
public:
    CorrelationScope();
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope&) = delete;
    CorrelationScope& operator=(const CorrelationScope&) = delete;

    const std::string& id() const { return id_; }

private:
    std::string previous_;
    std::string id_;
};

} // namespace TNORM

#define LOG_DEBUG(module, message) TNORM::Logger::getInstance().log(TNORM::LogLevel::DEBUG, module, message)
#define LOG_INFO(module, message) TNORM::Logger::getInstance().log(TNORM::LogLevel::INFO, module, message)
#define LOG_WARN(module, message) TNORM::Logger::getInstance().log(TNORM::LogLevel::WARN, module, message)
#define LOG_ERROR(module, message) TNORM::Logger::getInstance().log(TNORM::LogLevel::ERROR, module, message)

// EN: Variadic so that a braced field list with commas passes through as one argument.
// FR: Variadique pour qu'une liste de champs entre accolades avec virgules passe comme un seul argument.
#define LOG_DEBUG_META(module, message, ...) \
    TNORM::Logger::getInstance().log(TNORM::LogLevel::DEBUG, module, message, TNORM::LogFields __VA_ARGS__)
#define LOG_INFO_META(module, message, ...) \
    TNORM::Logger::getInstance().log(TNORM::LogLevel::INFO, module, message, TNORM::LogFields __VA_ARGS__)
#define LOG_WARN_META(module, message, ...) \
    TNORM::Logger::getInstance().log(TNORM::LogLevel::WARN, module, message, TNORM::LogFields __VA_ARGS__)
#define LOG_ERROR_META(module, message, ...) \
    TNORM::Logger::getInstance().log(TNORM::LogLevel::ERROR, module, message, TNORM::LogFields __VA_ARGS__)
