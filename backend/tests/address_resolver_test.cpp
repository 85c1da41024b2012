#include <gtest/gtest.h>

#include "net/address_resolver.h"

TEST(AddressResolverTest, VirtualInterfaceNames) {
    EXPECT_TRUE(is_virtual_interface("docker0"));
    EXPECT_TRUE(is_virtual_interface("vboxnet0"));
    EXPECT_TRUE(is_virtual_interface("vmnet8"));
    EXPECT_TRUE(is_virtual_interface("VirtualBox Host-Only Network"));
    EXPECT_TRUE(is_virtual_interface("vEthernet (Docker)"));
    EXPECT_FALSE(is_virtual_interface("wlan0"));
    EXPECT_FALSE(is_virtual_interface("eth0"));
    EXPECT_FALSE(is_virtual_interface("Wi-Fi"));
}

TEST(AddressResolverTest, SkipsVirtualAndLoopback) {
    const std::vector<InterfaceAddress> interfaces = {
        {"lo", "127.0.0.1", true},
        {"docker0", "172.17.0.1", false},
        {"VBoxNet0", "192.168.56.1", false},
        {"vmnet1", "172.16.1.1", false},
        {"Hyper-V Virtual Ethernet", "172.20.0.1", false},
        {"wlan0", "192.168.1.23", false},
        {"eth0", "10.0.0.5", false},
    };
    EXPECT_EQ(select_lan_address(interfaces), "192.168.1.23");
}

TEST(AddressResolverTest, FirstAddressOfFirstUsableInterface) {
    const std::vector<InterfaceAddress> interfaces = {
        {"eth0", "10.0.0.5", false},
        {"eth0", "10.0.0.6", false},
        {"wlan0", "192.168.1.23", false},
    };
    EXPECT_EQ(select_lan_address(interfaces), "10.0.0.5");
}

TEST(AddressResolverTest, FallsBackToLoopback) {
    EXPECT_EQ(select_lan_address({}), "127.0.0.1");
    EXPECT_EQ(select_lan_address({{"lo", "127.0.0.1", true}, {"docker0", "172.17.0.1", false}}),
              "127.0.0.1");
}

TEST(AddressResolverTest, ResolvedAddressNeverBelongsToVirtualInterface) {
    const auto interfaces = list_ipv4_interfaces();
    const auto address = resolve_lan_address();

    EXPECT_FALSE(address.empty());
    for (const auto& iface : interfaces) {
        if (iface.address == address && address != kLoopbackAddress) {
            bool shared_with_real = false;
            for (const auto& other : interfaces) {
                if (other.address == address && !is_virtual_interface(other.name)) {
                    shared_with_real = true;
                }
            }
            EXPECT_TRUE(shared_with_real) << address << " only on " << iface.name;
        }
    }
}
