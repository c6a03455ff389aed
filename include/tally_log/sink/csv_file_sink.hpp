#ifndef TALLY_LOG_CSV_FILE_SINK_HPP
#define TALLY_LOG_CSV_FILE_SINK_HPP

#include "level_file_sink.hpp"
#include "../core/log_common.hpp"
#include "../formatter/csv_formatter.hpp"

namespace tally {
    /// Per-level CSV files under {directory}/csv/, each starting with a
    /// "timestamp,level,message" header row.
    class CsvFileSink : public LevelFileSink {
    public:
        explicit CsvFileSink(const std::string &directory)
            : LevelFileSink(directory, FileFormat::Csv, detail::make_unique<CsvFormatter>()) {}
    };
} // namespace tally

#endif // TALLY_LOG_CSV_FILE_SINK_HPP
