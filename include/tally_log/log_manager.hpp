#ifndef TALLY_LOG_MANAGER_HPP
#define TALLY_LOG_MANAGER_HPP

#include "core/log_common.hpp"
#include "core/log_entry.hpp"
#include "core/log_level.hpp"
#include "core/errors.hpp"
#include "core/file_format.hpp"
#include "core/file_system.hpp"
#include "core/persistence_policy.hpp"
#include "core/dispatch_queue.hpp"
#include "config/default_paths.hpp"
#include "sink/sink_interface.hpp"
#include "sink/color_console_sink.hpp"
#include "sink/csv_file_sink.hpp"
#include "sink/json_file_sink.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <future>
#include <memory>
#include <string>

namespace tally {

    class LogManagerConfiguration;

    /// Leveled logger writing every record to the console and, depending on
    /// the persistence policy, to a per-level JSON-Lines or CSV file.
    ///
    /// Each severity has a blocking entry point (debug(), info(), ...) and a
    /// non-blocking one (debugAsync(), infoAsync(), ...).  Both run the same
    /// dispatch: console first, then the file if the level is persisted by
    /// default or the caller passed saveFile = true.  The non-blocking form
    /// hands that work to the manager's dispatch thread and returns a future
    /// that becomes ready when both writes are done; get() rethrows any
    /// WriteError or SerializationError.
    ///
    /// @code
    ///   tally::LogManager log("data/logs");
    ///   log.warning("low disk space");                         // json/warning.json
    ///   log.debug("x = 1", true, tally::FileFormat::Csv);      // csv/debug.csv
    ///   log.errorAsync("request failed").get();
    /// @endcode
    ///
    /// Files are opened and closed per write, so several managers may point
    /// at the same directory; appends are not coordinated between them.
    ///
    /// A non-blocking call made from the dispatch thread itself (for example
    /// from a CallbackSink callback) runs inline and returns a ready future.
    /// A manager must not be destroyed from inside one of its own sinks.
    class LogManager {
    public:
        static const char *defaultLoggerName() { return "tally_log"; }

        /// @throws ConfigurationError if @p directory is empty or cannot be
        ///         created.
        explicit LogManager(const std::string &directory = defaultLogDirectory(),
                            FileFormat defaultFormat = FileFormat::Json)
            : LogManager(directory, defaultFormat, defaultLoggerName(),
                         detail::make_unique<ColorConsoleSink>()) {}

        LogManager(const std::string &directory, FileFormat defaultFormat,
                   const std::string &loggerName, std::unique_ptr<ISink> console)
            : m_directory(directory)
              , m_defaultFormat(defaultFormat)
              , m_loggerName(loggerName)
              , m_console(std::move(console))
              , m_csvSink(directory)
              , m_jsonSink(directory) {
            if (m_directory.empty()) {
                throw ConfigurationError("log directory must not be empty");
            }
            if (!detail::isDirectory(m_directory)) {
                if (!detail::mkdirRecursive(m_directory)) {
                    throw ConfigurationError("cannot create log directory '" + m_directory + "': "
                                             + std::strerror(errno));
                }
                writeConsole(makeEntry(LogLevel::INFO, "Log directory created: " + m_directory));
            }
        }

        ~LogManager() {
            m_dispatch.stop();
        }

        LogManager(const LogManager &) = delete;

        LogManager &operator=(const LogManager &) = delete;

        LogManager(LogManager &&) = delete;

        LogManager &operator=(LogManager &&) = delete;

        static LogManagerConfiguration configure();

        void log(LogLevel level, const std::string &message, bool saveFile = false) {
            dispatch(makeEntry(level, message), saveFile, m_defaultFormat);
        }

        void log(LogLevel level, const std::string &message, bool saveFile, FileFormat format) {
            dispatch(makeEntry(level, message), saveFile, format);
        }

        std::future<void> logAsync(LogLevel level, const std::string &message, bool saveFile = false) {
            return logAsync(level, message, saveFile, m_defaultFormat);
        }

        std::future<void> logAsync(LogLevel level, const std::string &message, bool saveFile,
                                   FileFormat format) {
            LogEntry entry = makeEntry(level, message);
            return m_dispatch.submit([this, entry, saveFile, format]() {
                dispatch(entry, saveFile, format);
            });
        }

        void debug(const std::string &message, bool saveFile = false) {
            log(LogLevel::DEBUG, message, saveFile);
        }

        void debug(const std::string &message, bool saveFile, FileFormat format) {
            log(LogLevel::DEBUG, message, saveFile, format);
        }

        void info(const std::string &message, bool saveFile = false) {
            log(LogLevel::INFO, message, saveFile);
        }

        void info(const std::string &message, bool saveFile, FileFormat format) {
            log(LogLevel::INFO, message, saveFile, format);
        }

        void warning(const std::string &message, bool saveFile = false) {
            log(LogLevel::WARNING, message, saveFile);
        }

        void warning(const std::string &message, bool saveFile, FileFormat format) {
            log(LogLevel::WARNING, message, saveFile, format);
        }

        void error(const std::string &message, bool saveFile = false) {
            log(LogLevel::ERROR, message, saveFile);
        }

        void error(const std::string &message, bool saveFile, FileFormat format) {
            log(LogLevel::ERROR, message, saveFile, format);
        }

        void critical(const std::string &message, bool saveFile = false) {
            log(LogLevel::CRITICAL, message, saveFile);
        }

        void critical(const std::string &message, bool saveFile, FileFormat format) {
            log(LogLevel::CRITICAL, message, saveFile, format);
        }

        std::future<void> debugAsync(const std::string &message, bool saveFile = false) {
            return logAsync(LogLevel::DEBUG, message, saveFile);
        }

        std::future<void> debugAsync(const std::string &message, bool saveFile, FileFormat format) {
            return logAsync(LogLevel::DEBUG, message, saveFile, format);
        }

        std::future<void> infoAsync(const std::string &message, bool saveFile = false) {
            return logAsync(LogLevel::INFO, message, saveFile);
        }

        std::future<void> infoAsync(const std::string &message, bool saveFile, FileFormat format) {
            return logAsync(LogLevel::INFO, message, saveFile, format);
        }

        std::future<void> warningAsync(const std::string &message, bool saveFile = false) {
            return logAsync(LogLevel::WARNING, message, saveFile);
        }

        std::future<void> warningAsync(const std::string &message, bool saveFile, FileFormat format) {
            return logAsync(LogLevel::WARNING, message, saveFile, format);
        }

        std::future<void> errorAsync(const std::string &message, bool saveFile = false) {
            return logAsync(LogLevel::ERROR, message, saveFile);
        }

        std::future<void> errorAsync(const std::string &message, bool saveFile, FileFormat format) {
            return logAsync(LogLevel::ERROR, message, saveFile, format);
        }

        std::future<void> criticalAsync(const std::string &message, bool saveFile = false) {
            return logAsync(LogLevel::CRITICAL, message, saveFile);
        }

        std::future<void> criticalAsync(const std::string &message, bool saveFile, FileFormat format) {
            return logAsync(LogLevel::CRITICAL, message, saveFile, format);
        }

        const std::string &directory() const { return m_directory; }

        FileFormat defaultFormat() const { return m_defaultFormat; }

        const std::string &loggerName() const { return m_loggerName; }

        const PersistencePolicy &policy() const { return m_policy; }

        /// Path a record of @p level is appended to in @p format.
        std::string filePath(LogLevel level, FileFormat format) const {
            return fileSink(format).filePath(level);
        }

        /// Non-blocking calls queued but not yet started.
        size_t pendingAsync() const { return m_dispatch.pending(); }

    private:
        std::string m_directory;
        FileFormat m_defaultFormat;
        std::string m_loggerName;
        PersistencePolicy m_policy;
        std::unique_ptr<ISink> m_console;
        CsvFileSink m_csvSink;
        JsonFileSink m_jsonSink;
        detail::DispatchQueue m_dispatch;

        LogEntry makeEntry(LogLevel level, const std::string &message) const {
            return LogEntry{level, message, std::chrono::system_clock::now(), m_loggerName,
                            currentProcessId()};
        }

        void dispatch(const LogEntry &entry, bool saveFile, FileFormat format) {
            writeConsole(entry);
            if (!m_policy.shouldPersist(entry.level, saveFile)) {
                return;
            }
            fileSink(format).write(entry);
        }

        LevelFileSink &fileSink(FileFormat format) {
            if (format == FileFormat::Csv) return m_csvSink;
            return m_jsonSink;
        }

        const LevelFileSink &fileSink(FileFormat format) const {
            if (format == FileFormat::Csv) return m_csvSink;
            return m_jsonSink;
        }

        // Console failures are reported, not propagated: the file write
        // still has to happen.
        void writeConsole(const LogEntry &entry) {
            if (!m_console) return;
            try {
                m_console->write(entry);
            } catch (const std::exception &e) {
                std::fprintf(stderr, "tally_log: console sink failed: %s\n", e.what());
            }
        }
    };

} // namespace tally

#include "log_manager_configuration.hpp"

namespace tally {
    inline LogManagerConfiguration LogManager::configure() {
        return LogManagerConfiguration();
    }
} // namespace tally

#endif // TALLY_LOG_MANAGER_HPP
