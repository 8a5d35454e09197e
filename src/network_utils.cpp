#ifdef _WIN32
    // Include winsock2.h first to avoid conflicts with windows.h
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
#endif

#include "network_utils.h"
#include "socket.h"
#include "logger.h"
#include <cstring>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_INFO(message)  LOG_INFO("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace lanmeet {
namespace network_utils {

std::string resolve_hostname(const std::string& hostname) {
    LOG_NETUTILS_DEBUG("Resolving hostname: " << hostname);

    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << WSAGetLastError());
#else
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
#endif
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)result->ai_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);

    freeaddrinfo(result);

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip_str);
    return std::string(ip_str);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

std::string get_local_ip() {
    const std::string fallback = "127.0.0.1";

    socket_t route_socket = socket(AF_INET, SOCK_DGRAM, 0);
    if (!is_valid_socket(route_socket)) {
        LOG_NETUTILS_WARN("Failed to create route socket, using " << fallback);
        return fallback;
    }

    sockaddr_in remote;
    memset(&remote, 0, sizeof(remote));
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::string local_ip = fallback;
    if (connect(route_socket, (struct sockaddr*)&remote, sizeof(remote)) == 0) {
        sockaddr_in local;
        socklen_t len = sizeof(local);
        if (getsockname(route_socket, (struct sockaddr*)&local, &len) == 0) {
            char ip_str[INET_ADDRSTRLEN];
            if (inet_ntop(AF_INET, &local.sin_addr, ip_str, INET_ADDRSTRLEN) != nullptr) {
                local_ip = ip_str;
            }
        }
    } else {
        LOG_NETUTILS_DEBUG("No route for local address lookup, using " << fallback);
    }

    close_socket(route_socket);
    return local_ip;
}

bool parse_address_string(const std::string& address, std::string& host, int& port) {
    size_t colon = address.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= address.size()) {
        return false;
    }

    std::string port_str = address.substr(colon + 1);
    for (char c : port_str) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    if (port_str.size() > 5) {
        return false;
    }

    host = address.substr(0, colon);
    port = std::stoi(port_str);
    return port > 0 && port <= 65535;
}

} // namespace network_utils
} // namespace lanmeet
