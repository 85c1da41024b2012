/**
 * AddressResolver - enumerates local IPv4 interfaces with getifaddrs and
 * selects the one to advertise in the session URL.
 */

#include "net/address_resolver.h"
#include "util/string_util.h"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

constexpr std::array<const char*, 4> kVirtualMarkers = {"virtual", "vmnet", "vbox", "docker"};

} // namespace

std::vector<InterfaceAddress> list_ipv4_interfaces() {
    std::vector<InterfaceAddress> result;

    ifaddrs* ifap = nullptr;
    if (getifaddrs(&ifap) != 0) {
        spdlog::warn("getifaddrs failed: {}", std::strerror(errno));
        return result;
    }

    for (auto* ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if ((ifa->ifa_flags & IFF_UP) == 0) {
            continue;
        }

        char ip_str[INET_ADDRSTRLEN] = {};
        const auto* sa = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr);
        if (inet_ntop(AF_INET, &sa->sin_addr, ip_str, sizeof(ip_str)) == nullptr) {
            continue;
        }

        InterfaceAddress entry;
        entry.name = ifa->ifa_name != nullptr ? ifa->ifa_name : "";
        entry.address = ip_str;
        entry.loopback = (ifa->ifa_flags & IFF_LOOPBACK) != 0;
        result.push_back(std::move(entry));
    }

    freeifaddrs(ifap);
    return result;
}

bool is_virtual_interface(const std::string& name) {
    const auto lowered = to_lower(name);
    for (const char* marker : kVirtualMarkers) {
        if (lowered.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::string select_lan_address(const std::vector<InterfaceAddress>& interfaces) {
    for (const auto& iface : interfaces) {
        if (iface.loopback || is_virtual_interface(iface.name)) {
            spdlog::debug("Skipping interface {} ({})", iface.name, iface.address);
            continue;
        }
        return iface.address;
    }
    return kLoopbackAddress;
}

std::string resolve_lan_address() {
    const auto address = select_lan_address(list_ipv4_interfaces());
    if (address == kLoopbackAddress) {
        spdlog::warn("No LAN interface found, falling back to {}", address);
    }
    return address;
}
