#ifndef TALLY_LOG_DEFAULT_PATHS_HPP
#define TALLY_LOG_DEFAULT_PATHS_HPP

#include <cstdlib>
#include <string>

namespace tally {

    /// Log root used when a LogManager is built without a directory.
    /// `TALLY_LOG_DIR` wins when set and non-empty; otherwise "data/logs"
    /// relative to the working directory.
    inline std::string defaultLogDirectory() {
        const char *fromEnv = std::getenv("TALLY_LOG_DIR");
        if (fromEnv && fromEnv[0] != '\0') {
            return fromEnv;
        }
        return "data/logs";
    }

} // namespace tally

#endif // TALLY_LOG_DEFAULT_PATHS_HPP
