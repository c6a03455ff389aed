#ifndef TALLY_LOG_JSON_FILE_SINK_HPP
#define TALLY_LOG_JSON_FILE_SINK_HPP

#include "level_file_sink.hpp"
#include "../core/log_common.hpp"
#include "../formatter/json_formatter.hpp"

namespace tally {
    /// Per-level JSON-Lines files under {directory}/json/.
    class JsonFileSink : public LevelFileSink {
    public:
        explicit JsonFileSink(const std::string &directory)
            : LevelFileSink(directory, FileFormat::Json, detail::make_unique<JsonFormatter>()) {}
    };
} // namespace tally

#endif // TALLY_LOG_JSON_FILE_SINK_HPP
