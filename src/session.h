#pragma once

#include "client_registry.h"
#include "config.h"
#include "connection.h"
#include "event_sink.h"
#include "file_transfer.h"
#include "message.h"
#include "socket.h"
#include "threadmanager.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace lanmeet {

enum class SessionRole {
    NONE,
    HOST,
    CLIENT
};

enum class HostState {
    IDLE,
    LISTENING,
    CLOSED
};

enum class ClientState {
    IDLE,
    CONNECTING,
    CONNECTED,
    DISCONNECTED
};

const char* session_role_name(SessionRole role);
const char* host_state_name(HostState state);
const char* client_state_name(ClientState state);

/**
 * A meeting session, either as its host or as one joined client.
 *
 * The host accepts clients in a star topology: every accepted connection is
 * greeted with the handshake, registered, and served by its own receive
 * thread. Chat and video from one client are relayed to all others. A client
 * keeps a single connection to the host and one receive thread for it.
 *
 * Each instance plays one role once: Idle -> Listening -> Closed for a host,
 * Idle -> Connecting -> Connected -> Disconnected for a client. Everything the
 * session observes is reported through the EventSink given at construction.
 */
class SessionManager : public ThreadManager {
public:
    explicit SessionManager(EventSink& sink, const SessionConfig& config = SessionConfig());
    ~SessionManager();

    //=========================================================================
    // Host
    //=========================================================================

    /**
     * Bind, listen and start accepting clients
     * @return true if listening; false if the session already started or the
     *         bind/listen failed (reported through on_connection_error)
     */
    bool create_session();

    /**
     * End the session. A host closes the listener and every client; a client
     * disconnects. Safe to call repeatedly.
     */
    void stop();

    //=========================================================================
    // Client
    //=========================================================================

    /**
     * Connect to a host and wait for its handshake, retrying per the config.
     * Blocks until connected or out of attempts.
     * @throws ConnectFailed after the last failed attempt
     * @throws SessionError if this session already has a role
     */
    void join_session(const std::string& address, int port);

    // Close the connection to the host and wait for the receive thread
    void disconnect();

    //=========================================================================
    // Messaging (both roles)
    //=========================================================================

    /**
     * Send a chat line to everyone else and echo it locally through on_chat()
     * @return false if there is no live session or the write failed
     */
    bool send_chat(const std::string& text);

    /**
     * Start sending a file in the background
     * @return false if there is no live session, no recipient, or the file cannot be read
     */
    bool send_file(const std::string& path);

    /**
     * Send one encoded camera frame to everyone else
     * @return false if there is no live session or nothing was delivered
     */
    bool send_video_frame(const std::vector<uint8_t>& frame);

    //=========================================================================
    // Introspection
    //=========================================================================

    SessionRole get_role() const { return role_.load(); }
    HostState get_host_state() const { return host_state_.load(); }
    ClientState get_client_state() const { return client_state_.load(); }
    size_t get_client_count() const;
    int get_listen_port() const { return listen_port_.load(); }

    // Addresses of the joined clients (host) or of the host (client)
    std::vector<std::string> get_peer_addresses() const;

    // Configured name, or "host" / "client" when none is set
    std::string get_display_name() const;

    const SessionConfig& get_config() const { return config_; }

protected:
    /**
     * Greet a newly accepted client. A client that cannot be greeted is
     * dropped without being registered.
     * @throws ConnectionError if the write fails
     */
    virtual void send_handshake(Connection& connection);

private:
    EventSink& sink_;
    SessionConfig config_;

    std::atomic<SessionRole> role_;
    std::atomic<HostState> host_state_;
    std::atomic<ClientState> client_state_;
    std::atomic<bool> running_;
    std::mutex lifecycle_mutex_;

    // Host
    socket_t listen_socket_;
    std::atomic<int> listen_port_;
    ClientRegistry registry_;

    // Client
    std::shared_ptr<Connection> server_connection_;
    mutable std::mutex server_connection_mutex_;

    FileTransferEngine file_transfer_;

    // session_host.cpp
    void accept_loop();
    void handle_client(std::shared_ptr<Connection> connection);
    void handle_host_message(const std::shared_ptr<Connection>& connection, const Message& message);
    void stop_host();
    void enter_host_closed();

    // session_client.cpp
    std::shared_ptr<Connection> connect_once(const std::string& address, int port, std::string& error);
    void receive_loop(std::shared_ptr<Connection> connection);
    void handle_client_message(const Message& message, const std::string& source);
    void finish_client_connection(const std::string& reason);
    std::shared_ptr<Connection> get_server_connection() const;
    bool send_to_host(const Message& message);

    MessageSender make_file_sender();
};

} // namespace lanmeet
