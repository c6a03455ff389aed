#ifndef TALLY_LOG_STDOUT_TRANSPORT_HPP
#define TALLY_LOG_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>

namespace tally {
namespace detail {
    /// Write one line to @p os.  If the write fails (closed terminal, broken
    /// pipe) the stream is put back in the state it had before the call, so
    /// later lines are attempted again and a state the host set itself, such
    /// as badbit to silence std::cout, is kept.
    inline void writeConsoleLine(std::ostream& os, const std::string& line) {
        std::ios_base::iostate before = os.rdstate();
        os << line << '\n' << std::flush;
        if (os.rdstate() != before) {
            os.clear(before);
        }
    }
} // namespace detail

    /// @note All StdoutTransport instances share a single mutex so that
    ///       concurrent writes to stdout are serialized.  StderrTransport
    ///       has its own independent mutex, so stdout and stderr writes
    ///       may interleave at the terminal level.
    class StdoutTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            detail::writeConsoleLine(std::cout, formattedEntry);
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    class StderrTransport : public ITransport {
    public:
        void write(const std::string &formattedEntry) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            detail::writeConsoleLine(std::cerr, formattedEntry);
        }

    private:
        static std::mutex& sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };
} // namespace tally

#endif // TALLY_LOG_STDOUT_TRANSPORT_HPP
