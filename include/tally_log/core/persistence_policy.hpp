#ifndef TALLY_LOG_PERSISTENCE_POLICY_HPP
#define TALLY_LOG_PERSISTENCE_POLICY_HPP

#include "log_level.hpp"

namespace tally {

    /// Decides whether a record is written to a file.
    ///
    /// WARNING and above are always persisted; DEBUG and INFO go to the
    /// console only unless the caller asks for the file.  The per-call flag
    /// is OR-ed in, so it can force persistence on but never off.
    class PersistencePolicy {
    public:
        bool isPersisted(LogLevel level) const {
            switch (level) {
                case LogLevel::DEBUG: return false;
                case LogLevel::INFO: return false;
                case LogLevel::WARNING: return true;
                case LogLevel::ERROR: return true;
                case LogLevel::CRITICAL: return true;
                default: return false;
            }
        }

        bool shouldPersist(LogLevel level, bool saveFile) const {
            return isPersisted(level) || saveFile;
        }
    };

} // namespace tally

#endif // TALLY_LOG_PERSISTENCE_POLICY_HPP
