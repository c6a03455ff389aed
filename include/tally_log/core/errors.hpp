#ifndef TALLY_LOG_ERRORS_HPP
#define TALLY_LOG_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace tally {
    /// Base of every exception thrown by the library.
    class TallyLogError : public std::runtime_error {
    public:
        explicit TallyLogError(const std::string &what) : std::runtime_error(what) {}
    };

    /// The manager cannot be set up: the target directory cannot be created,
    /// or a level / format name is not recognized.
    class ConfigurationError : public TallyLogError {
    public:
        explicit ConfigurationError(const std::string &what) : TallyLogError(what) {}
    };

    /// A single record could not be written to its target file.
    class WriteError : public TallyLogError {
    public:
        WriteError(const std::string &path, const std::string &reason)
            : TallyLogError("failed to write '" + path + "': " + reason)
            , m_path(path) {}

        const std::string &path() const { return m_path; }

    private:
        std::string m_path;
    };

    /// A record could not be encoded in the requested file format.
    class SerializationError : public TallyLogError {
    public:
        explicit SerializationError(const std::string &what) : TallyLogError(what) {}
    };
} // namespace tally

#endif // TALLY_LOG_ERRORS_HPP
