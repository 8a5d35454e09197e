#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace lanmeet {

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to a server over IPv4
 * @param host The hostname or IP address to connect to
 * @param port The port number to connect to
 * @param timeout_ms Connection timeout in milliseconds (0 for blocking)
 * @return Connected blocking socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client(const std::string& host, int port, int timeout_ms = 0);

/**
 * Create a TCP server socket bound to an IPv4 address
 * @param bind_address Local address to bind ("0.0.0.0" for all interfaces)
 * @param port The port number to bind to (0 for an ephemeral port)
 * @param backlog The maximum number of pending connections
 * @return Socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server(const std::string& bind_address, int port, int backlog = 5);

/**
 * Accept a client connection on a server socket
 * @param server_socket The server socket handle
 * @return Client socket handle, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Get the peer address (IP:port) from a connected socket
 * @param socket The connected socket handle
 * @return Peer address string in format "IP:port", or empty string on error
 */
std::string get_peer_address(socket_t socket);

/**
 * Get the local port a socket is bound to
 * @param socket The socket handle
 * @return The bound port, or 0 on error
 */
int get_bound_port(socket_t socket);

/**
 * Send every byte of a buffer, looping over partial writes
 * @param socket The socket handle
 * @param data Pointer to the bytes to send
 * @param size Number of bytes to send
 * @return true if all bytes were written, false on error
 */
bool send_all(socket_t socket, const uint8_t* data, size_t size);

/**
 * Receive exactly num_bytes bytes (blocking until complete)
 * @param socket The socket handle
 * @param buffer Destination buffer of at least num_bytes bytes
 * @param num_bytes Number of bytes to receive
 * @return num_bytes on success, 0 if the peer closed the connection before
 *         all bytes arrived, -1 on socket error (including receive timeout)
 */
long receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes);

/**
 * Set a receive timeout on a blocking socket
 * @param socket The socket handle
 * @param timeout_ms Timeout in milliseconds, 0 clears the timeout
 * @return true if successful, false otherwise
 */
bool set_socket_receive_timeout(socket_t socket, int timeout_ms);

/**
 * Connect to a socket address with timeout
 * @param socket The socket handle (should be non-blocking)
 * @param addr The socket address structure
 * @param addr_len Length of the address structure
 * @param timeout_ms Connection timeout in milliseconds
 * @return true if connected successfully, false on timeout or error
 */
bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms);

// Common Socket Functions
/**
 * Shut down both directions of a socket without releasing the handle.
 * Any thread blocked in accept() or recv() on it returns immediately.
 * @param socket The socket handle
 */
void shutdown_socket(socket_t socket);

/**
 * Close a socket
 * @param socket The socket handle to close
 */
void close_socket(socket_t socket);

/**
 * Check if a socket is valid
 * @param socket The socket handle to check
 * @return true if valid, false otherwise
 */
bool is_valid_socket(socket_t socket);

/**
 * Set socket blocking mode
 * @param socket The socket handle
 * @param blocking true for blocking, false for non-blocking
 * @return true if successful, false otherwise
 */
bool set_socket_blocking(socket_t socket, bool blocking);

/**
 * Describe the last socket error of the calling thread
 */
std::string last_socket_error();

} // namespace lanmeet
