#ifndef TALLY_LOG_LEVEL_HPP
#define TALLY_LOG_LEVEL_HPP

#include "errors.hpp"
#include <string>
#include <cctype>

namespace tally {
    enum class LogLevel {
        DEBUG,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    /// Upper-case name used in console lines, CSV rows and JSON records.
    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARNING: return "WARNING";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::CRITICAL: return "CRITICAL";
            default: return "UNKNOWN";
        }
    }

    /// Lower-case name used as the per-level file stem.
    inline const char *getLevelFileStem(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARNING: return "warning";
            case LogLevel::ERROR: return "error";
            case LogLevel::CRITICAL: return "critical";
            default: return "unknown";
        }
    }

    inline LogLevel parseLogLevel(const std::string &name) {
        std::string lower;
        lower.reserve(name.size());
        for (char c : name) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "critical") return LogLevel::CRITICAL;
        throw ConfigurationError("unknown log level: '" + name + "'");
    }
} // namespace tally

#endif // TALLY_LOG_LEVEL_HPP
