#include "adbee/Models.h"

#include <arpa/inet.h>
#include <netinet/in.h>

namespace Adbee {

std::string Endpoint::toString() const {
    if (isIpv6()) {
        return "[" + address + "]:" + std::to_string(port);
    }
    return address + ":" + std::to_string(port);
}

bool isIpv4Address(const std::string& address) {
    in_addr addr{};
    return inet_pton(AF_INET, address.c_str(), &addr) == 1;
}

std::optional<Endpoint> selectEndpoint(const ServiceAnnouncement& announcement) {
    if (announcement.resolvedAddresses.empty() || announcement.port == 0) {
        return std::nullopt;
    }

    // Сначала IPv4
    for (const auto& address : announcement.resolvedAddresses) {
        if (isIpv4Address(address)) {
            return Endpoint{address, announcement.port};
        }
    }

    for (const auto& address : announcement.resolvedAddresses) {
        if (!address.empty()) {
            return Endpoint{address, announcement.port};
        }
    }

    return std::nullopt;
}

} // namespace Adbee
