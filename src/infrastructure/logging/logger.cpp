// EN: Logger implementation. Lines are serialized outside the lock and written under it.
// FR: Implémentation du Logger. Les lignes sont sérialisées hors verrou et écrites sous verrou.

#include "tnorm/infrastructure/logging/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <random>
#include <sstream>
#include <thread>

namespace TNORM {

namespace {

constexpr std::array<const char*, 6> kReservedKeys = {
    "timestamp", "level", "module", "message", "correlation_id", "thread_id"};

bool isReserved(const std::string& key) {
    return std::find(kReservedKeys.begin(), kReservedKeys.end(), key) != kReservedKeys.end();
}

// EN: UTC, millisecond precision: 2024-05-01T12:34:56.789Z
// FR: UTC, précision milliseconde : 2024-05-01T12:34:56.789Z
std::string formatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto since_epoch = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch());
    const std::time_t seconds = static_cast<std::time_t>(since_epoch.count() / 1000);
    const int millis = static_cast<int>(since_epoch.count() % 1000);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  utc.tm_year + 1900, utc.tm_mon + 1, utc.tm_mday,
                  utc.tm_hour, utc.tm_min, utc.tm_sec, millis);
    return buffer;
}

std::string currentThreadId() {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}

} // namespace

std::optional<LogLevel> parseLogLevel(const std::string& text) {
    std::string lower(text.size(), '\0');
    std::transform(text.begin(), text.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    return std::nullopt;
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    flush();
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
}

LogLevel Logger::getLogLevel() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::isEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= level_;
}

bool Logger::setOutputFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.reset();
    if (filename.empty()) {
        return true;
    }

    auto stream = std::make_unique<std::ofstream>(filename, std::ios::out | std::ios::app);
    if (!stream->is_open()) {
        return false;
    }
    file_ = std::move(stream);
    console_ = ConsoleSink::NONE;
    return true;
}

void Logger::setConsoleSink(ConsoleSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = sink;
}

void Logger::setCorrelationId(const std::string& correlation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = correlation_id;
}

std::string Logger::getCorrelationId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

std::string Logger::generateCorrelationId() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> nibble(0, 15);
    static const char* const kHex = "0123456789abcdef";

    std::string id;
    id.reserve(36);
    for (int i = 0; i < 32; ++i) {
        if (i == 8 || i == 12 || i == 16 || i == 20) {
            id.push_back('-');
        }
        id.push_back(kHex[nibble(engine)]);
    }
    return id;
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message, const LogFields& fields) {
    LogEntry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < level_) {
            return;
        }
        entry.correlation_id = correlation_id_;
    }
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.module = module;
    entry.message = message;
    entry.thread_id = currentThreadId();
    entry.fields = fields;

    write(formatAsNDJSON(entry));
}

void Logger::write(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        *file_ << line << '\n';
    }
    if (console_ == ConsoleSink::STDOUT) {
        std::cout << line << '\n';
    } else if (console_ == ConsoleSink::STDERR) {
        std::cerr << line << '\n';
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        file_->flush();
    }
    std::cout.flush();
    std::cerr.flush();
}

// EN: Invalid UTF-8 in messages is replaced rather than throwing from a log call.
// FR: L'UTF-8 invalide des messages est remplacé plutôt que de lever depuis un appel de log.
std::string Logger::formatAsNDJSON(const LogEntry& entry) {
    nlohmann::ordered_json json;
    json["timestamp"] = formatTimestamp(entry.timestamp);
    json["level"] = levelToString(entry.level);
    json["module"] = entry.module;
    json["message"] = entry.message;
    if (!entry.correlation_id.empty()) {
        json["correlation_id"] = entry.correlation_id;
    }
    json["thread_id"] = entry.thread_id;

    for (const auto& [key, value] : entry.fields) {
        if (!isReserved(key)) {
            json[key] = value;
        }
    }
    return json.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string Logger::levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

CorrelationScope::CorrelationScope()
    : previous_(Logger::getInstance().getCorrelationId()), id_(Logger::generateCorrelationId()) {
    Logger::getInstance().setCorrelationId(id_);
}

CorrelationScope::~CorrelationScope() {
    Logger::getInstance().setCorrelationId(previous_);
}

} // namespace TNORM
