#include <gtest/gtest.h>

#include <macaddress/MacAddress.hpp>

#include <map>
#include <set>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace Tests
{
class TestMacAddress : public testing::Test
{
public:
    macaddress::MacAddress mac{ macaddress::MacAddress::octets_t{
        0x12, 0x34, 0x56, 0xAB, 0xCD, 0xEF } };
};

TEST_F(TestMacAddress, test_from_octets)
{
    const macaddress::MacAddress::octets_t eui{ 0x12, 0x34, 0x56, 0xAB, 0xCD,
        0xEF };
    const auto a = macaddress::MacAddress::from_octets(eui);
    ASSERT_EQ(a.get_octets(), eui);
    ASSERT_EQ(a, mac);
    ASSERT_EQ(a[0], 0x12);
    ASSERT_EQ(a[5], 0xEF);
}

TEST_F(TestMacAddress, test_nil_and_broadcast)
{
    const auto nil = macaddress::MacAddress::nil();
    const auto bcast = macaddress::MacAddress::broadcast();

    ASSERT_TRUE(nil.is_nil());
    ASSERT_FALSE(bcast.is_nil());
    ASSERT_TRUE(bcast.is_broadcast());
    ASSERT_FALSE(nil.is_broadcast());
    ASSERT_FALSE(mac.is_nil());
    ASSERT_FALSE(mac.is_broadcast());

    // default constructed is the nil address
    ASSERT_EQ(macaddress::MacAddress(), nil);
    ASSERT_EQ(macaddress::MacAddress::zero(), nil);

    ASSERT_EQ(nil.to_canonical(), "00:00:00:00:00:00");
    ASSERT_EQ(bcast.to_canonical(), "FF:FF:FF:FF:FF:FF");
}

TEST_F(TestMacAddress, test_formatting)
{
    ASSERT_EQ(mac.to_canonical(), "12:34:56:AB:CD:EF");
    ASSERT_EQ(mac.to_hex_string(), "12-34-56-AB-CD-EF");
    ASSERT_EQ(mac.to_dot_string(), "1234.56AB.CDEF");
    ASSERT_EQ(mac.to_hexadecimal(), "0x123456ABCDEF");

    ASSERT_EQ(mac.to_string(macaddress::MacAddressFormat::CANONICAL),
        mac.to_canonical());
    ASSERT_EQ(mac.to_string(macaddress::MacAddressFormat::HEX_STRING),
        mac.to_hex_string());
    ASSERT_EQ(mac.to_string(macaddress::MacAddressFormat::DOT_NOTATION),
        mac.to_dot_string());
    ASSERT_EQ(mac.to_string(macaddress::MacAddressFormat::HEXADECIMAL),
        mac.to_hexadecimal());
}

TEST_F(TestMacAddress, test_formatting_zero_pads)
{
    const macaddress::MacAddress a{ macaddress::MacAddress::octets_t{
        0x01, 0x02, 0x03, 0x0A, 0x0B, 0x0F } };
    ASSERT_EQ(a.to_canonical(), "01:02:03:0A:0B:0F");
    ASSERT_EQ(a.to_hex_string(), "01-02-03-0A-0B-0F");
    ASSERT_EQ(a.to_dot_string(), "0102.030A.0B0F");
    ASSERT_EQ(a.to_hexadecimal(), "0x0102030A0B0F");
}

TEST_F(TestMacAddress, test_default_text_conversion)
{
    ASSERT_EQ(mac.to_string(), mac.to_canonical());
    ASSERT_EQ(std::format("{}", mac), mac.to_canonical());
    ASSERT_EQ(std::format("mac={}", mac), "mac=12:34:56:AB:CD:EF");

    std::stringstream ss;
    ss << mac;
    ASSERT_EQ(ss.str(), mac.to_canonical());
}

TEST_F(TestMacAddress, test_ordering)
{
    const macaddress::MacAddress lowest{ macaddress::MacAddress::octets_t{
        0, 0, 0, 0, 0, 0 } };
    const macaddress::MacAddress low{ macaddress::MacAddress::octets_t{
        0, 0, 0, 0, 0, 1 } };
    const macaddress::MacAddress highest{ macaddress::MacAddress::octets_t{
        255, 255, 255, 255, 255, 255 } };

    ASSERT_LT(lowest, low);
    ASSERT_LT(low, highest);
    ASSERT_LT(lowest, highest);
    ASSERT_GT(highest, low);
    ASSERT_LE(low, low);
    ASSERT_GE(low, low);
    ASSERT_FALSE(low < low);

    // octet 0 is the most significant
    const macaddress::MacAddress first{ macaddress::MacAddress::octets_t{
        1, 0, 0, 0, 0, 0 } };
    const macaddress::MacAddress last{ macaddress::MacAddress::octets_t{
        0, 255, 255, 255, 255, 255 } };
    ASSERT_LT(last, first);
    ASSERT_LT(last.to_uint64(), first.to_uint64());
}

TEST_F(TestMacAddress, test_sorted_container)
{
    std::set<macaddress::MacAddress> addresses;
    addresses.insert(macaddress::MacAddress::broadcast());
    addresses.insert(mac);
    addresses.insert(macaddress::MacAddress::nil());
    addresses.insert(macaddress::MacAddress(mac.get_octets()));

    ASSERT_EQ(addresses.size(), 3u);
    ASSERT_EQ(*addresses.begin(), macaddress::MacAddress::nil());
    ASSERT_EQ(*addresses.rbegin(), macaddress::MacAddress::broadcast());

    std::map<macaddress::MacAddress, int> ports;
    ports[mac] = 7;
    ASSERT_EQ(ports.at(macaddress::MacAddress(mac.get_octets())), 7);
}

TEST_F(TestMacAddress, test_equality_and_hash)
{
    const macaddress::MacAddress copy(mac.get_octets());
    ASSERT_EQ(copy, mac);
    ASSERT_FALSE(copy != mac);
    ASSERT_NE(mac, macaddress::MacAddress::nil());

    std::hash<macaddress::MacAddress> hasher;
    ASSERT_EQ(hasher(copy), hasher(mac));

    std::unordered_map<macaddress::MacAddress, std::string> names;
    names[mac] = "eth0";
    names[macaddress::MacAddress::broadcast()] = "bcast";

    const auto it = names.find(copy);
    ASSERT_NE(it, names.end());
    ASSERT_EQ(it->second, "eth0");

    std::unordered_set<macaddress::MacAddress> seen{ mac, copy };
    ASSERT_EQ(seen.size(), 1u);
}

TEST_F(TestMacAddress, test_to_uint64)
{
    ASSERT_EQ(mac.to_uint64(), 0x123456ABCDEFull);
    ASSERT_EQ(macaddress::MacAddress::nil().to_uint64(), 0u);
    ASSERT_EQ(macaddress::MacAddress::broadcast().to_uint64(),
        0xFFFFFFFFFFFFull);
}

TEST_F(TestMacAddress, test_address_bits)
{
    ASSERT_TRUE(mac.is_unicast());
    ASSERT_FALSE(mac.is_multicast());
    ASSERT_TRUE(mac.is_universal());
    ASSERT_FALSE(mac.is_local());

    ASSERT_TRUE(macaddress::MacAddress::broadcast().is_multicast());

    // IPv4 multicast mapped address
    const macaddress::MacAddress mcast{ macaddress::MacAddress::octets_t{
        0x01, 0x00, 0x5E, 0x00, 0x00, 0xFB } };
    ASSERT_TRUE(mcast.is_multicast());
    ASSERT_FALSE(mcast.is_unicast());
    ASSERT_TRUE(mcast.is_universal());

    const macaddress::MacAddress local{ macaddress::MacAddress::octets_t{
        0x02, 0x42, 0xAC, 0x11, 0x00, 0x02 } };
    ASSERT_TRUE(local.is_local());
    ASSERT_FALSE(local.is_universal());
    ASSERT_TRUE(local.is_unicast());
}

TEST_F(TestMacAddress, test_oui_and_nic)
{
    const std::array<uint8_t, 3> oui{ 0x12, 0x34, 0x56 };
    const std::array<uint8_t, 3> nic{ 0xAB, 0xCD, 0xEF };
    ASSERT_EQ(mac.oui(), oui);
    ASSERT_EQ(mac.nic(), nic);
}

} // namespace Tests
