#ifndef TALLY_LOG_MANAGER_CONFIGURATION_HPP
#define TALLY_LOG_MANAGER_CONFIGURATION_HPP

// This header is included internally by log_manager.hpp AFTER the
// LogManager class definition.  It must not be included directly; use
// tally_log.hpp.

#include "core/errors.hpp"
#include "core/file_format.hpp"
#include "core/log_common.hpp"
#include "config/default_paths.hpp"
#include "sink/sink_interface.hpp"
#include "sink/color_console_sink.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace tally {

    class LogManager;

    /// Fluent builder for a LogManager.
    ///
    /// Usage:
    /// @code
    ///   auto log = LogManager::configure()
    ///       .directory("data/tmp/logs")
    ///       .defaultFormat(FileFormat::Csv)
    ///       .loggerName("billing")
    ///       .writeConsoleTo<ColorConsoleSink>(ConsoleStream::StdErr)
    ///       .build();
    /// @endcode
    ///
    /// Unset options fall back to the LogManager defaults: defaultLogDirectory(),
    /// FileFormat::Json, "tally_log" and a ColorConsoleSink on stdout.
    class LogManagerConfiguration {
    public:
        LogManagerConfiguration()
            : m_directory(defaultLogDirectory())
            , m_defaultFormat(FileFormat::Json)
            , m_loggerName(LogManager::defaultLoggerName())
            , m_built(false) {}

        LogManagerConfiguration(const LogManagerConfiguration&) = delete;
        LogManagerConfiguration& operator=(const LogManagerConfiguration&) = delete;
        LogManagerConfiguration(LogManagerConfiguration&&) = default;
        LogManagerConfiguration& operator=(LogManagerConfiguration&&) = default;

        /// @throws ConfigurationError if @p path is empty.
        LogManagerConfiguration& directory(const std::string& path) {
            if (path.empty()) {
                throw ConfigurationError("log directory must not be empty");
            }
            m_directory = path;
            return *this;
        }

        LogManagerConfiguration& defaultFormat(FileFormat format) {
            m_defaultFormat = format;
            return *this;
        }

        /// Accepts "json" or "csv", case-insensitive.
        LogManagerConfiguration& defaultFormat(const std::string& name) {
            m_defaultFormat = parseFileFormat(name);
            return *this;
        }

        /// Value of "logger_name" in JSON records.
        LogManagerConfiguration& loggerName(const std::string& name) {
            m_loggerName = name;
            return *this;
        }

        /// Replace the console sink.  Passing nullptr disables console output.
        LogManagerConfiguration& console(std::unique_ptr<ISink> sink) {
            m_console = std::move(sink);
            m_consoleSet = true;
            return *this;
        }

        template<typename SinkType, typename... Args>
        typename std::enable_if<
            std::is_base_of<ISink, SinkType>::value &&
            std::is_constructible<SinkType, Args...>::value,
            LogManagerConfiguration&
        >::type
        writeConsoleTo(Args&&... args) {
            return console(detail::make_unique<SinkType>(std::forward<Args>(args)...));
        }

        /// Construct the configured LogManager.
        ///
        /// @throws ConfigurationError if the directory cannot be created.
        /// @throws std::logic_error if called more than once.
        std::unique_ptr<LogManager> build() {
            if (m_built) {
                throw std::logic_error("LogManagerConfiguration::build() called more than once");
            }
            m_built = true;
            std::unique_ptr<ISink> consoleSink = m_consoleSet
                ? std::move(m_console)
                : std::unique_ptr<ISink>(detail::make_unique<ColorConsoleSink>());
            return std::unique_ptr<LogManager>(new LogManager(
                m_directory, m_defaultFormat, m_loggerName, std::move(consoleSink)));
        }

    private:
        std::string m_directory;
        FileFormat m_defaultFormat;
        std::string m_loggerName;
        std::unique_ptr<ISink> m_console;
        bool m_consoleSet = false;
        bool m_built;
    };

} // namespace tally

#endif // TALLY_LOG_MANAGER_CONFIGURATION_HPP
