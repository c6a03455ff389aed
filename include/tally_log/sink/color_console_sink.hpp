#ifndef TALLY_LOG_COLOR_CONSOLE_SINK_HPP
#define TALLY_LOG_COLOR_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/console_formatter.hpp"
#include "../transport/stdout_transport.hpp"
#include <atomic>
#include <cstdlib>
#include <cstdio>
#include <string>

#ifdef _WIN32
#include <io.h>
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
// windows.h defines ERROR as 0, which conflicts with LogLevel::ERROR.
#ifdef ERROR
#undef ERROR
#endif
#ifndef ENABLE_VIRTUAL_TERMINAL_PROCESSING
#define ENABLE_VIRTUAL_TERMINAL_PROCESSING 0x0004
#endif
#else
#include <unistd.h>
#endif

namespace tally {
    enum class ConsoleStream {
        StdOut,
        StdErr
    };

    /// Console sink that styles the level column of each line.
    ///
    /// Lines look like
    ///   [10/19/26 14:03:07] | WARNING  | low disk space
    /// and, with color enabled, the level column (padding included) is
    /// wrapped in the level's ANSI style.  The message body is left
    /// uncolored.
    ///
    /// Color is auto-disabled when:
    ///   - the stream is not a TTY (piped / redirected)
    ///   - `NO_COLOR` environment variable is set (any value, https://no-color.org/)
    ///   - `TALLY_LOG_NO_COLOR` environment variable is set (non-empty)
    class ColorConsoleSink : public ISink {
    public:
        explicit ColorConsoleSink(ConsoleStream stream = ConsoleStream::StdOut) {
            setFormatter(detail::make_unique<ConsoleFormatter>());
            if (stream == ConsoleStream::StdOut) {
                setTransport(detail::make_unique<StdoutTransport>());
            } else {
                setTransport(detail::make_unique<StderrTransport>());
            }
            m_colorEnabled.store(detectAndEnableColorSupport(stream), std::memory_order_relaxed);
        }

        /// Override color auto-detection.
        void setColor(bool enabled) { m_colorEnabled.store(enabled, std::memory_order_relaxed); }

        bool isColorEnabled() const { return m_colorEnabled.load(std::memory_order_relaxed); }

        void write(const LogEntry &entry) override {
            IFormatter *fmt = formatter();
            ITransport *tp = transport();
            if (fmt && tp) {
                std::string formatted = fmt->format(entry);
                if (m_colorEnabled.load(std::memory_order_relaxed)) {
                    formatted = colorize(formatted, entry.level);
                }
                tp->write(formatted);
            }
        }

        /// Wrap the level column of a ConsoleFormatter line in ANSI codes.
        /// The column is the text between the first "] | " and the next
        /// " | ".  Text without that shape, or a level without a style, is
        /// returned unchanged.
        static std::string colorize(const std::string &text, LogLevel level) {
            const char *color = getColorCode(level);
            if (color[0] == '\0') return text;

            static const std::string kOpen = "] | ";
            static const std::string kSeparator = " | ";
            size_t open = text.find(kOpen);
            if (open == std::string::npos) return text;
            size_t start = open + kOpen.size();
            size_t end = text.find(kSeparator, start);
            if (end == std::string::npos) return text;

            std::string result;
            result.reserve(text.size() + 16);
            result.append(text, 0, start);
            result += color;
            result.append(text, start, end - start);
            result += "\033[0m";
            result.append(text, end, std::string::npos);
            return result;
        }

        /// ANSI escape code for a level; empty (terminal default) for
        /// values outside the enum.
        static const char *getColorCode(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "\033[36m";      // cyan
                case LogLevel::INFO: return "\033[32m";       // green
                case LogLevel::WARNING: return "\033[33m";    // yellow
                case LogLevel::ERROR: return "\033[31m";      // red
                case LogLevel::CRITICAL: return "\033[1;31m"; // bold red
                default: return "";
            }
        }

    private:
        std::atomic<bool> m_colorEnabled;

        static bool detectAndEnableColorSupport(ConsoleStream stream) {
            if (std::getenv("NO_COLOR") != nullptr) return false;

            const char *noColor = std::getenv("TALLY_LOG_NO_COLOR");
            if (noColor && noColor[0] != '\0') return false;

#ifdef _WIN32
            DWORD handleType = (stream == ConsoleStream::StdOut)
                ? STD_OUTPUT_HANDLE : STD_ERROR_HANDLE;
            HANDLE hOut = GetStdHandle(handleType);
            if (hOut == INVALID_HANDLE_VALUE) return false;
            DWORD mode = 0;
            if (!GetConsoleMode(hOut, &mode)) return false;
            if (!(mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING)) {
                return SetConsoleMode(hOut, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
            }
            return true;
#else
            FILE *fp = (stream == ConsoleStream::StdOut) ? stdout : stderr;
            return isatty(fileno(fp)) != 0;
#endif
        }
    };
} // namespace tally

#endif // TALLY_LOG_COLOR_CONSOLE_SINK_HPP
