#ifndef TALLY_LOG_CALLBACK_SINK_HPP
#define TALLY_LOG_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/console_formatter.hpp"
#include <functional>
#include <string>
#include <memory>

namespace tally {

    /// Sink that invokes a user-provided callback for each log entry.
    /// Typically installed as the LogManager's console sink when the host
    /// owns the terminal, or to capture console output.
    ///
    /// Two variants:
    ///   1. EntryCallback - receives the raw LogEntry.
    ///   2. StringCallback - receives the formatted line (ConsoleFormatter
    ///      by default, or a user-supplied formatter).
    ///
    /// @note The callback is called without a lock and, for the
    ///       non-blocking convention, on the manager's dispatch thread.
    ///       Logging back into the same manager from the callback is
    ///       allowed: a xxxAsync() call made there runs inline instead of
    ///       queueing behind the current record, so get() on its future
    ///       does not block.  Guard against the callback re-entering itself
    ///       without end.
    class CallbackSink : public ISink {
    public:
        typedef std::function<void(const LogEntry&)> EntryCallback;
        typedef std::function<void(const std::string&)> StringCallback;

        /// In C++11, wrap lambdas in the typedef to avoid overload ambiguity:
        /// @code
        ///   CallbackSink(CallbackSink::EntryCallback([](const LogEntry& e) { ... }))
        /// @endcode
        explicit CallbackSink(EntryCallback cb)
            : m_entryCallback(std::move(cb))
            , m_mode(Mode::Entry) {}

        explicit CallbackSink(StringCallback cb, std::unique_ptr<IFormatter> fmt = nullptr)
            : m_stringCallback(std::move(cb))
            , m_mode(Mode::String) {
            if (fmt) {
                setFormatter(std::move(fmt));
            } else {
                setFormatter(detail::make_unique<ConsoleFormatter>());
            }
        }

        void write(const LogEntry &entry) override {
            if (m_mode == Mode::Entry) {
                if (m_entryCallback) {
                    m_entryCallback(entry);
                }
            } else {
                IFormatter *fmt = formatter();
                if (m_stringCallback && fmt) {
                    m_stringCallback(fmt->format(entry));
                }
            }
        }

    private:
        enum class Mode { Entry, String };

        EntryCallback m_entryCallback;
        StringCallback m_stringCallback;
        Mode m_mode;
    };

} // namespace tally

#endif // TALLY_LOG_CALLBACK_SINK_HPP
