#pragma once

#include "core/result.hpp"
#include "network/discovery.hpp"

#include <QByteArray>
#include <QHostAddress>

namespace manuscripts::network {

// UDP discovery message helpers (used by UdpDiscoveryBackend).
// Kept separate so encode/decode can be tested without sockets.

struct DiscoveryDatagram {
    ServiceRecord record;
    bool bye = false;  // the sender is withdrawing `record`
};

QByteArray encode_discovery_datagram(const ServiceRecord& record, bool bye = false);

Result<DiscoveryDatagram, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                           const QHostAddress& sender);

} // namespace manuscripts::network
