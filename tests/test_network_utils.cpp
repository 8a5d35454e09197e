#include <gtest/gtest.h>
#include "network_utils.h"
#include "socket.h"
#include <string>

using namespace lanmeet;

class NetworkUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_socket_library();
    }
};

// Test IPv4 address validation
TEST_F(NetworkUtilsTest, IPv4ValidationTest) {
    EXPECT_TRUE(network_utils::is_valid_ipv4("127.0.0.1"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("192.168.1.1"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("0.0.0.0"));
    EXPECT_TRUE(network_utils::is_valid_ipv4("255.255.255.255"));

    EXPECT_FALSE(network_utils::is_valid_ipv4("256.0.0.1"));       // Out of range
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1"));       // Missing octet
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1.1.1"));   // Extra octet
    EXPECT_FALSE(network_utils::is_valid_ipv4("192.168.1.-1"));    // Negative number
    EXPECT_FALSE(network_utils::is_valid_ipv4("localhost"));
    EXPECT_FALSE(network_utils::is_valid_ipv4(""));
}

TEST_F(NetworkUtilsTest, ResolveAddress) {
    EXPECT_EQ(network_utils::resolve_hostname("192.168.7.7"), "192.168.7.7");
    EXPECT_EQ(network_utils::resolve_hostname(""), "");

    std::string localhost = network_utils::resolve_hostname("localhost");
    EXPECT_FALSE(localhost.empty());
    EXPECT_TRUE(network_utils::is_valid_ipv4(localhost));
}

TEST_F(NetworkUtilsTest, UnresolvableHostname) {
    EXPECT_EQ(network_utils::resolve_hostname("no-such-host.invalid"), "");
}

TEST_F(NetworkUtilsTest, LocalIpIsAnAddress) {
    std::string ip = network_utils::get_local_ip();
    EXPECT_TRUE(network_utils::is_valid_ipv4(ip)) << ip;
}

TEST_F(NetworkUtilsTest, ParseAddressString) {
    std::string host;
    int port = 0;

    ASSERT_TRUE(network_utils::parse_address_string("192.168.1.10:9999", host, port));
    EXPECT_EQ(host, "192.168.1.10");
    EXPECT_EQ(port, 9999);

    ASSERT_TRUE(network_utils::parse_address_string("meeting-room.local:80", host, port));
    EXPECT_EQ(host, "meeting-room.local");
    EXPECT_EQ(port, 80);

    EXPECT_FALSE(network_utils::parse_address_string("192.168.1.10", host, port));
    EXPECT_FALSE(network_utils::parse_address_string(":9999", host, port));
    EXPECT_FALSE(network_utils::parse_address_string("host:", host, port));
    EXPECT_FALSE(network_utils::parse_address_string("host:http", host, port));
    EXPECT_FALSE(network_utils::parse_address_string("host:70000", host, port));
    EXPECT_FALSE(network_utils::parse_address_string("host:0", host, port));
}
