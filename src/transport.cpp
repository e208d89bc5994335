#include "transport.hpp"

#include <algorithm>

void TransportRegistry::add(std::unique_ptr<ProtocolTransport> transport)
{
    if (!transport)
    {
        return;
    }

    Protocol protocol = transport->protocol();
    transports_.erase(std::remove_if(transports_.begin(), transports_.end(),
                                     [protocol](const std::unique_ptr<ProtocolTransport> &existing)
                                     { return existing->protocol() == protocol; }),
                      transports_.end());
    transports_.push_back(std::move(transport));
}

ProtocolTransport *TransportRegistry::find(Protocol protocol) const
{
    for (const auto &transport : transports_)
    {
        if (transport->protocol() == protocol)
        {
            return transport.get();
        }
    }
    return nullptr;
}
