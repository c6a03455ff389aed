#ifndef TALLY_LOG_LEVEL_FILE_SINK_HPP
#define TALLY_LOG_LEVEL_FILE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/errors.hpp"
#include "../core/file_format.hpp"
#include "../core/file_system.hpp"
#include "../transport/file_transport.hpp"
#include <cerrno>
#include <cstring>
#include <string>

namespace tally {

    /// Writes each record to {directory}/{format}/{level}{ext}.
    ///
    /// Nothing is held open between writes.  The record is formatted first,
    /// so an encoding failure leaves the file untouched.  If the formatter
    /// has a header and the file does not exist yet, the header is written
    /// in the same append as the first record.
    ///
    /// The existence check and the append are not atomic: two writers
    /// creating the same file at once may both write the header.
    class LevelFileSink : public ISink {
    public:
        LevelFileSink(const std::string &directory, FileFormat format,
                      std::unique_ptr<IFormatter> fmt)
            : m_directory(directory)
            , m_format(format) {
            setFormatter(std::move(fmt));
        }

        void write(const LogEntry &entry) override {
            IFormatter *fmt = formatter();
            if (!fmt) return;
            std::string record = fmt->format(entry);

            std::string dir = formatDirectory();
            if (!detail::mkdirRecursive(dir)) {
                throw WriteError(dir, std::string("cannot create directory (") + std::strerror(errno) + ")");
            }

            std::string path = filePath(entry.level);
            std::string payload;
            std::string header = fmt->header();
            if (!header.empty() && !detail::pathExists(path)) {
                payload += header;
                payload += fmt->lineTerminator();
            }
            payload += record;
            payload += fmt->lineTerminator();

            FileTransport(path).write(payload);
        }

        const std::string &directory() const { return m_directory; }

        FileFormat format() const { return m_format; }

        std::string formatDirectory() const {
            return detail::joinPath(m_directory, getFormatString(m_format));
        }

        std::string filePath(LogLevel level) const {
            return detail::joinPath(formatDirectory(),
                                    std::string(getLevelFileStem(level)) + getFormatExtension(m_format));
        }

    private:
        std::string m_directory;
        FileFormat m_format;
    };

} // namespace tally

#endif // TALLY_LOG_LEVEL_FILE_SINK_HPP
