#pragma once

#include <string>
#include <vector>

/**
 * Picks the IPv4 address a phone on the same LAN can reach us on.
 *
 * Interfaces whose names mark them as virtualisation or container adapters
 * ("virtual", "vmnet", "vbox", "docker", case-insensitive) are skipped.
 */
struct InterfaceAddress {
    std::string name;
    std::string address;   // dotted quad
    bool loopback = false;
};

inline constexpr const char* kLoopbackAddress = "127.0.0.1";

/// Every IPv4 address on an interface that is up, in enumeration order.
std::vector<InterfaceAddress> list_ipv4_interfaces();

bool is_virtual_interface(const std::string& name);

/// First address of the first non-loopback, non-virtual interface, else 127.0.0.1.
std::string select_lan_address(const std::vector<InterfaceAddress>& interfaces);

/// select_lan_address(list_ipv4_interfaces())
std::string resolve_lan_address();
