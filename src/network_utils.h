#pragma once

#include <string>

namespace lanmeet {
namespace network_utils {

/**
 * Resolve hostname to an IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 *
 * Example usage:
 *   std::string ip = network_utils::resolve_hostname("meeting-room.local");
 *   std::string ip2 = network_utils::resolve_hostname("192.168.1.1"); // returns same IP
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Get the local IPv4 address other machines on the LAN would use to reach us.
 * Determined from the source address the routing table picks for an outbound
 * UDP "connection" (no packet is sent).
 * @return Local IP address, or "127.0.0.1" if it cannot be determined
 */
std::string get_local_ip();

/**
 * Split "host:port" into its parts
 * @param address Address string
 * @param host Output host part
 * @param port Output port part
 * @return true if both parts were present and the port is numeric
 */
bool parse_address_string(const std::string& address, std::string& host, int& port);

} // namespace network_utils
} // namespace lanmeet
