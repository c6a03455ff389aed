#ifndef TALLY_LOG_JSON_FORMATTER_HPP
#define TALLY_LOG_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../core/errors.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>

namespace tally {
    /// One JSON object per record, keys in a fixed order:
    /// timestamp, level, message, logger_name, process_id.
    class JsonFormatter : public IFormatter {
    public:
        std::string format(const LogEntry &entry) const override {
            nlohmann::ordered_json j;
            j["timestamp"] = formatIsoTimestamp(entry.timestamp);
            j["level"] = getLevelString(entry.level);
            j["message"] = entry.message;
            j["logger_name"] = entry.loggerName;
            j["process_id"] = entry.processId;
            try {
                return j.dump();
            } catch (const nlohmann::json::type_error &e) {
                // dump() rejects strings that are not valid UTF-8.
                throw SerializationError(std::string("cannot encode record as JSON: ") + e.what());
            }
        }
    };
} // namespace tally

#endif // TALLY_LOG_JSON_FORMATTER_HPP
