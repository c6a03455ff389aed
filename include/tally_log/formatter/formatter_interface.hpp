#ifndef TALLY_LOG_FORMATTER_INTERFACE_HPP
#define TALLY_LOG_FORMATTER_INTERFACE_HPP

#include "../core/log_entry.hpp"
#include <string>

namespace tally {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        /// Render one record, without the line terminator.
        virtual std::string format(const LogEntry &entry) const = 0;

        /// Line written once at the top of a newly created file.
        /// Empty for self-describing formats.
        virtual std::string header() const { return std::string(); }

        virtual const char *lineTerminator() const { return "\n"; }
    };
} // namespace tally

#endif // TALLY_LOG_FORMATTER_INTERFACE_HPP
