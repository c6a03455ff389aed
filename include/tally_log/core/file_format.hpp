#ifndef TALLY_LOG_FILE_FORMAT_HPP
#define TALLY_LOG_FILE_FORMAT_HPP

#include "errors.hpp"
#include <string>
#include <cctype>

namespace tally {
    enum class FileFormat {
        Json,
        Csv
    };

    /// Name of the format; also the subdirectory its files live in.
    inline const char *getFormatString(FileFormat format) {
        switch (format) {
            case FileFormat::Json: return "json";
            case FileFormat::Csv: return "csv";
            default: return "unknown";
        }
    }

    inline const char *getFormatExtension(FileFormat format) {
        switch (format) {
            case FileFormat::Json: return ".json";
            case FileFormat::Csv: return ".csv";
            default: return "";
        }
    }

    inline FileFormat parseFileFormat(const std::string &name) {
        std::string lower;
        lower.reserve(name.size());
        for (char c : name) {
            lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (lower == "json") return FileFormat::Json;
        if (lower == "csv") return FileFormat::Csv;
        throw ConfigurationError("unknown file format: '" + name + "' (expected json or csv)");
    }
} // namespace tally

#endif // TALLY_LOG_FILE_FORMAT_HPP
