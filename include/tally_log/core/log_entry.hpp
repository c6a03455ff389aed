#ifndef TALLY_LOG_ENTRY_HPP
#define TALLY_LOG_ENTRY_HPP

#include "log_level.hpp"
#include <string>
#include <chrono>

namespace tally {
    struct LogEntry {
        LogLevel level;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        std::string loggerName;
        long processId;
    };
} // namespace tally

#endif // TALLY_LOG_ENTRY_HPP
