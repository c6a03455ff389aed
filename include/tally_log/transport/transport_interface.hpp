#ifndef TALLY_LOG_TRANSPORT_INTERFACE_HPP
#define TALLY_LOG_TRANSPORT_INTERFACE_HPP

#include <string>

namespace tally {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        virtual void write(const std::string& formattedEntry) = 0;
    };

} // namespace tally

#endif // TALLY_LOG_TRANSPORT_INTERFACE_HPP
