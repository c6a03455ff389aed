#ifndef TALLY_LOG_FILE_TRANSPORT_HPP
#define TALLY_LOG_FILE_TRANSPORT_HPP

#include "transport_interface.hpp"
#include "../core/errors.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <string>

namespace tally {
    /// Appends to a file without holding it open: every write() opens the
    /// file in append mode, writes the payload verbatim, flushes and closes.
    ///
    /// The payload is emitted with a single write so that a record is not
    /// split between two appends.  Failures throw WriteError.
    class FileTransport : public ITransport {
    public:
        explicit FileTransport(const std::string &filename) : m_filename(filename) {}

        void write(const std::string &payload) override {
            errno = 0;
            std::ofstream file(m_filename, std::ios::out | std::ios::app | std::ios::binary);
            if (!file.is_open()) {
                throw WriteError(m_filename, lastErrorText("cannot open for append"));
            }
            file.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            file.flush();
            if (!file) {
                throw WriteError(m_filename, lastErrorText("write failed"));
            }
            file.close();
            if (file.fail()) {
                throw WriteError(m_filename, lastErrorText("close failed"));
            }
        }

        const std::string &filename() const { return m_filename; }

    private:
        std::string m_filename;

        static std::string lastErrorText(const char *fallback) {
            if (errno != 0) {
                return std::string(fallback) + " (" + std::strerror(errno) + ")";
            }
            return fallback;
        }
    };
} // namespace tally

#endif // TALLY_LOG_FILE_TRANSPORT_HPP
