#pragma once

#include "connection.h"
#include "event_sink.h"
#include "message.h"
#include "socket.h"
#include <memory>
#include <mutex>
#include <vector>

namespace lanmeet {

/**
 * The host's set of live client connections.
 *
 * Membership changes and broadcasts may race freely: broadcast() works on a
 * snapshot taken under the lock and writes outside it, so a slow peer never
 * blocks add()/remove(). A connection that fails during a broadcast is removed
 * and closed on the spot; the remaining peers still get the message.
 */
class ClientRegistry {
public:
    explicit ClientRegistry(EventSink* sink = nullptr);
    ~ClientRegistry();

    ClientRegistry(const ClientRegistry&) = delete;
    ClientRegistry& operator=(const ClientRegistry&) = delete;

    void add(const std::shared_ptr<Connection>& connection);

    /**
     * Remove a connection (does not close it)
     * @return true if it was present, false otherwise
     */
    bool remove(const std::shared_ptr<Connection>& connection);

    bool contains(const std::shared_ptr<Connection>& connection) const;
    size_t size() const;
    std::vector<std::shared_ptr<Connection>> snapshot() const;

    /**
     * Send one message to every connection except `exclude`.
     * The message is serialized once. Failed peers are dropped and reported
     * through EventSink::on_peer_left(address, true); nothing is thrown.
     * @return Number of connections the message was written to
     */
    int broadcast(const Message& message, const Connection* exclude = nullptr);

    // Same as broadcast() for a frame that is already length-prefixed
    int broadcast_frame(const std::vector<uint8_t>& frame, const Connection* exclude = nullptr);

    /**
     * Register the listening socket so stop() can unblock the accept loop.
     * The registry never releases the handle itself.
     */
    void set_listen_socket(socket_t socket);

    /**
     * Shut down the listening socket, close every connection and empty the set
     */
    void stop();

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;
    socket_t listen_socket_;
    EventSink* sink_;
};

} // namespace lanmeet
