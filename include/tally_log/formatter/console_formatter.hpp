#ifndef TALLY_LOG_CONSOLE_FORMATTER_HPP
#define TALLY_LOG_CONSOLE_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <string>

namespace tally {
    /// Renders "[MM/DD/YY HH:MM:SS] | LEVEL    | message".
    class ConsoleFormatter : public IFormatter {
    public:
        static const size_t kLevelWidth = 8;

        std::string format(const LogEntry &entry) const override {
            std::string result;
            result.reserve(entry.message.size() + 32);
            result += '[';
            result += formatConsoleTimestamp(entry.timestamp);
            result += "] | ";
            result += paddedLevel(entry.level);
            result += " | ";
            result += entry.message;
            return result;
        }

        /// Level name left-justified to the column width.  Names longer
        /// than the column are not truncated.
        static std::string paddedLevel(LogLevel level) {
            std::string name = getLevelString(level);
            if (name.size() < kLevelWidth) {
                name.append(kLevelWidth - name.size(), ' ');
            }
            return name;
        }
    };
} // namespace tally

#endif // TALLY_LOG_CONSOLE_FORMATTER_HPP
