#ifndef TALLY_LOG_CSV_FORMATTER_HPP
#define TALLY_LOG_CSV_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/log_common.hpp"
#include <string>

namespace tally {
    /// One "timestamp,level,message" row per record.
    ///
    /// Fields containing a comma, a double quote, CR or LF are wrapped in
    /// double quotes with embedded quotes doubled (RFC 4180).  Rows end in
    /// CRLF.
    class CsvFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            std::string row;
            row.reserve(entry.message.size() + 40);
            row += escapeField(formatTimestamp(entry.timestamp));
            row += ',';
            row += escapeField(getLevelString(entry.level));
            row += ',';
            row += escapeField(entry.message);
            return row;
        }

        std::string header() const override {
            return "timestamp,level,message";
        }

        const char *lineTerminator() const override { return "\r\n"; }

        static std::string escapeField(const std::string &field) {
            if (field.find_first_of(",\"\r\n") == std::string::npos) {
                return field;
            }
            std::string quoted;
            quoted.reserve(field.size() + 2);
            quoted += '"';
            for (char c : field) {
                if (c == '"') quoted += '"';
                quoted += c;
            }
            quoted += '"';
            return quoted;
        }
    };
} // namespace tally

#endif // TALLY_LOG_CSV_FORMATTER_HPP
