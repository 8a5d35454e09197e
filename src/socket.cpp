#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <cstring>
#ifndef _WIN32
    #include <fcntl.h>    // for O_NONBLOCK
    #include <errno.h>    // for errno
    #include <poll.h>
    #include <sys/time.h>
#endif

// Socket module logging macros
#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#ifdef MSG_NOSIGNAL
    #define LANMEET_SEND_FLAGS MSG_NOSIGNAL
#else
    #define LANMEET_SEND_FLAGS 0
#endif

namespace lanmeet {

// Socket Library Initialization
bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
    LOG_SOCKET_INFO("Windows Socket API initialized");
#endif
    LOG_SOCKET_DEBUG("Socket library initialized");
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
    LOG_SOCKET_INFO("Windows Socket API cleaned up");
#endif
    LOG_SOCKET_DEBUG("Socket library cleaned up");
}

std::string last_socket_error() {
#ifdef _WIN32
    return "WSA error " + std::to_string(WSAGetLastError());
#else
    return strerror(errno);
#endif
}

// TCP Socket Functions
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    // Validate port number
    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    // Resolve hostname to IP address
    std::string resolved_ip = network_utils::resolve_hostname(host);
    if (resolved_ip.empty()) {
        LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));

    // Convert IP address from string to binary form
    if (inet_pton(AF_INET, resolved_ip.c_str(), &server_addr.sin_addr) <= 0) {
        LOG_SOCKET_ERROR("Invalid address: " << resolved_ip);
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_DEBUG("Connecting to " << resolved_ip << ":" << port
                     << (timeout_ms > 0 ? " with timeout " + std::to_string(timeout_ms) + "ms" : ""));

    if (timeout_ms > 0) {
        if (!set_socket_blocking(client_socket, false)) {
            close_socket(client_socket);
            return INVALID_SOCKET_VALUE;
        }
        if (!connect_with_timeout(client_socket, (struct sockaddr*)&server_addr, sizeof(server_addr), timeout_ms)) {
            LOG_SOCKET_WARN("Connection to " << resolved_ip << ":" << port << " failed or timed out");
            close_socket(client_socket);
            return INVALID_SOCKET_VALUE;
        }
        if (!set_socket_blocking(client_socket, true)) {
            close_socket(client_socket);
            return INVALID_SOCKET_VALUE;
        }
    } else if (connect(client_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Connection to " << resolved_ip << ":" << port << " failed: " << last_socket_error());
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Connected to " << resolved_ip << ":" << port);
    return client_socket;
}

bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    int result = connect(socket, addr, addr_len);
    if (result == 0) {
        return true;
    }

#ifdef _WIN32
    if (WSAGetLastError() != WSAEWOULDBLOCK) {
        return false;
    }
    fd_set write_fds;
    FD_ZERO(&write_fds);
    FD_SET(socket, &write_fds);
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    result = select(0, nullptr, &write_fds, nullptr, &tv);
    if (result <= 0) {
        return false;
    }
#else
    if (errno != EINPROGRESS) {
        LOG_SOCKET_DEBUG("connect() failed immediately: " << last_socket_error());
        return false;
    }

    pollfd pfd;
    pfd.fd = socket;
    pfd.events = POLLOUT;
    pfd.revents = 0;
    do {
        result = poll(&pfd, 1, timeout_ms);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        LOG_SOCKET_DEBUG("connect() timed out after " << timeout_ms << "ms");
        return false;
    }
    if (result < 0) {
        LOG_SOCKET_DEBUG("poll() failed during connect: " << last_socket_error());
        return false;
    }
#endif

    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (getsockopt(socket, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len) == SOCKET_ERROR_VALUE) {
        return false;
    }
    if (so_error != 0) {
        LOG_SOCKET_DEBUG("connect() completed with error: " << strerror(so_error));
        return false;
    }
    return true;
}

socket_t create_tcp_server(const std::string& bind_address, int port, int backlog) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on " << bind_address << ":" << port);

    // Validate port number
    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (bind_address.empty() || bind_address == "0.0.0.0") {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address.c_str(), &server_addr.sin_addr) <= 0) {
        LOG_SOCKET_ERROR("Invalid bind address: " << bind_address);
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }

    // Set socket option to reuse address
    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR,
                   (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options: " << last_socket_error());
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    // Bind socket to address
    if (bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to " << bind_address << ":" << port
                         << ": " << last_socket_error());
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    // Listen for connections
    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket: " << last_socket_error());
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on " << bind_address << ":" << get_bound_port(server_socket)
                    << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
#ifndef _WIN32
    // A signal or a client that reset before we got to it is not a listener failure
    while (client_socket == INVALID_SOCKET_VALUE && (errno == EINTR || errno == ECONNABORTED)) {
        client_addr_len = sizeof(client_addr);
        client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
    }
#endif
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_DEBUG("accept() returned no connection: " << last_socket_error());
        return INVALID_SOCKET_VALUE;
    }

    if (client_addr.ss_family == AF_INET) {
        char client_ip[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)&client_addr;
        inet_ntop(AF_INET, &addr_in->sin_addr, client_ip, INET_ADDRSTRLEN);
        LOG_SOCKET_INFO("Client connected from " << client_ip << ":" << ntohs(addr_in->sin_port));
    } else {
        LOG_SOCKET_INFO("Client connected from unknown address family");
    }

    return client_socket;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, (struct sockaddr*)&peer_addr, &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get peer address for socket " << socket);
        return "";
    }

    if (peer_addr.ss_family != AF_INET) {
        LOG_SOCKET_ERROR("Unknown address family for socket " << socket);
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)&peer_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
    return std::string(ip_str) + ":" + std::to_string(ntohs(addr_in->sin_port));
}

int get_bound_port(socket_t socket) {
    sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getsockname(socket, (struct sockaddr*)&addr, &addr_len) == SOCKET_ERROR_VALUE) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(((sockaddr_in*)&addr)->sin_port);
    }
    return 0;
}

bool send_all(socket_t socket, const uint8_t* data, size_t size) {
    size_t total_sent = 0;
    while (total_sent < size) {
        auto bytes_sent = send(socket, (const char*)(data + total_sent),
                               static_cast<int>(size - total_sent), LANMEET_SEND_FLAGS);
        if (bytes_sent == SOCKET_ERROR_VALUE) {
#ifndef _WIN32
            if (errno == EINTR) {
                continue;
            }
#endif
            LOG_SOCKET_DEBUG("send() failed on socket " << socket << ": " << last_socket_error());
            return false;
        }
        if (bytes_sent == 0) {
            return false;
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
    return true;
}

long receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes) {
    size_t total_received = 0;
    while (total_received < num_bytes) {
        auto bytes_received = recv(socket, (char*)(buffer + total_received),
                                   static_cast<int>(num_bytes - total_received), 0);
        if (bytes_received == SOCKET_ERROR_VALUE) {
#ifndef _WIN32
            if (errno == EINTR) {
                continue;
            }
#endif
            LOG_SOCKET_DEBUG("recv() failed on socket " << socket << ": " << last_socket_error());
            return -1;
        }
        if (bytes_received == 0) {
            LOG_SOCKET_DEBUG("Connection closed by peer on socket " << socket
                             << " after " << total_received << "/" << num_bytes << " bytes");
            return 0;
        }
        total_received += static_cast<size_t>(bytes_received);
    }
    return static_cast<long>(total_received);
}

bool set_socket_receive_timeout(socket_t socket, int timeout_ms) {
#ifdef _WIN32
    DWORD tv = static_cast<DWORD>(timeout_ms);
#else
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
#endif
    if (setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set receive timeout on socket " << socket << ": " << last_socket_error());
        return false;
    }
    return true;
}

// Common Socket Functions
void shutdown_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Shutting down socket " << socket);
#ifdef _WIN32
        shutdown(socket, SD_BOTH);
#else
        shutdown(socket, SHUT_RDWR);
#endif
    }
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_blocking(socket_t socket, bool blocking) {
#ifdef _WIN32
    unsigned long mode = blocking ? 0 : 1;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1) {
        LOG_SOCKET_ERROR("Failed to get socket flags");
        return false;
    }

    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(socket, F_SETFL, flags) == -1) {
        LOG_SOCKET_ERROR("Failed to change socket blocking mode");
        return false;
    }
#endif
    return true;
}

} // namespace lanmeet
