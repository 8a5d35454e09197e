#pragma once

#include "message.h"
#include "socket.h"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace lanmeet {

/**
 * Which end of the star a connection represents
 */
enum class ConnectionRole {
    HOST_SIDE_PEER,     // Host's handle on one joined client
    CLIENT_SIDE_SERVER  // Client's handle on the host
};

/**
 * One open TCP connection.
 *
 * Writes are serialized, so frames coming from a broadcast, a file sender and
 * a video relay never interleave on the wire. close() may be called from any
 * thread, any number of times; only the first call has an effect. It shuts the
 * socket down so a blocked receive() returns ConnectionClosed. The handle
 * itself is released by the destructor, once no task can touch it anymore.
 */
class Connection {
public:
    Connection(socket_t socket, const std::string& peer_address, ConnectionRole role);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * Send one message
     * @throws ConnectionError if the connection is closed or the write fails
     */
    void send(const Message& message);

    /**
     * Send a pre-built frame (length prefix included)
     * @throws ConnectionError if the connection is closed or the write fails
     */
    void send_frame(const std::vector<uint8_t>& frame);

    /**
     * Block until one message arrives
     * @throws ConnectionClosed, ConnectionError, ProtocolError
     */
    Message receive();

    /**
     * Close the connection
     * @return true if this call performed the close, false if it was already closed
     */
    bool close();

    bool is_closed() const { return closed_.load(); }

    socket_t get_socket() const { return socket_; }
    const std::string& get_peer_address() const { return peer_address_; }
    ConnectionRole get_role() const { return role_; }

private:
    socket_t socket_;
    std::string peer_address_;
    ConnectionRole role_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_;
};

} // namespace lanmeet
