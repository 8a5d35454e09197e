#include "session.h"
#include "errors.h"
#include "log_macros.h"

namespace lanmeet {

void SessionManager::join_session(const std::string& address, int port) {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (role_.load() != SessionRole::NONE) {
            throw SessionError(std::string("Session already started as ") + session_role_name(role_.load()));
        }
        role_.store(SessionRole::CLIENT);
    }

    if (!init_socket_library()) {
        std::string message = "Failed to initialize the socket library";
        finish_client_connection(message);
        sink_.on_connection_error(message);
        throw ConnectFailed(message, 0);
    }

    const std::string target = address + ":" + std::to_string(port);
    std::string last_error = "no attempt made";
    int attempts = 0;

    for (int attempt = 1; attempt <= config_.retry_count; ++attempt) {
        if (is_shutdown_requested() || client_state_.load() == ClientState::DISCONNECTED) {
            last_error = "cancelled";
            break;
        }

        attempts = attempt;
        client_state_.store(ClientState::CONNECTING);
        LOG_CLIENT_INFO("Connecting to " << target << " (attempt " << attempt << "/" << config_.retry_count << ")");
        sink_.on_connection_state(ConnectionState::CONNECTING);

        std::shared_ptr<Connection> connection = connect_once(address, port, last_error);
        if (connection) {
            {
                std::lock_guard<std::mutex> lock(server_connection_mutex_);
                if (is_shutdown_requested()) {
                    connection->close();
                    last_error = "cancelled";
                    break;
                }
                server_connection_ = connection;
                client_state_.store(ClientState::CONNECTED);
                running_.store(true);
            }

            LOG_CLIENT_INFO("Joined session at " << connection->get_peer_address());
            sink_.on_connection_state(ConnectionState::CONNECTED);
            if (!add_managed_thread([this, connection]() { receive_loop(connection); }, "client-receive")) {
                // disconnect() ran between the state change and here
                connection->close();
                finish_client_connection("Disconnected");
            }
            return;
        }

        LOG_CLIENT_WARN("Attempt " << attempt << " to reach " << target << " failed: " << last_error);
        if (attempt < config_.retry_count && wait_for_shutdown(config_.retry_delay)) {
            last_error = "cancelled";
            break;
        }
    }

    std::string message = "Could not join " + target + " after " + std::to_string(attempts) +
                          (attempts == 1 ? " attempt: " : " attempts: ") + last_error;
    LOG_CLIENT_ERROR(message);
    finish_client_connection(message);
    sink_.on_connection_error(message);
    throw ConnectFailed(message, attempts);
}

std::shared_ptr<Connection> SessionManager::connect_once(const std::string& address, int port, std::string& error) {
    const int timeout_ms = static_cast<int>(config_.connect_timeout.count());

    socket_t socket = create_tcp_client(address, port, timeout_ms);
    if (!is_valid_socket(socket)) {
        error = "connection refused or timed out";
        return nullptr;
    }

    std::string peer_address = get_peer_address(socket);
    if (peer_address.empty()) {
        peer_address = address + ":" + std::to_string(port);
    }
    auto connection = std::make_shared<Connection>(socket, peer_address, ConnectionRole::CLIENT_SIDE_SERVER);

    // The handshake shares the connect budget
    if (timeout_ms > 0 && !set_socket_receive_timeout(socket, timeout_ms)) {
        error = "cannot set handshake timeout";
        return nullptr;
    }

    try {
        Message greeting = connection->receive();
        if (!is_handshake_message(greeting)) {
            error = std::string("unexpected ") + message_type_name(get_message_type(greeting)) +
                    " message instead of handshake";
            return nullptr;
        }
    } catch (const SessionError& e) {
        error = std::string("no handshake: ") + e.what();
        return nullptr;
    }

    if (timeout_ms > 0 && !set_socket_receive_timeout(socket, 0)) {
        error = "cannot clear handshake timeout";
        return nullptr;
    }
    return connection;
}

void SessionManager::receive_loop(std::shared_ptr<Connection> connection) {
    const std::string host_address = connection->get_peer_address();
    LOG_CLIENT_DEBUG("Receive loop started for " << host_address);

    std::string reason = "Connection to host closed";
    while (true) {
        Message message;
        try {
            message = connection->receive();
        } catch (const ProtocolError& e) {
            if (e.stream_intact()) {
                LOG_CLIENT_WARN("Skipping malformed message from host: " << e.what());
                continue;
            }
            reason = std::string("Protocol error from host: ") + e.what();
            LOG_CLIENT_ERROR(reason);
            sink_.on_connection_error(reason);
            break;
        } catch (const ConnectionClosed&) {
            LOG_CLIENT_INFO("Host closed the connection");
            break;
        } catch (const ConnectionError& e) {
            if (!connection->is_closed()) {
                reason = std::string("Connection to host lost: ") + e.what();
                LOG_CLIENT_ERROR(reason);
                sink_.on_connection_error(reason);
            }
            break;
        }

        handle_client_message(message, host_address);
    }

    connection->close();
    running_.store(false);
    finish_client_connection(reason);
    LOG_CLIENT_DEBUG("Receive loop ended");
}

void SessionManager::handle_client_message(const Message& message, const std::string& source) {
    switch (get_message_type(message)) {
        case MessageType::CHAT: {
            const auto& chat = std::get<ChatMessage>(message);
            sink_.on_chat(chat.sender, chat.content);
            break;
        }
        case MessageType::FILE_INFO:
        case MessageType::FILE_DATA:
        case MessageType::FILE_END:
            file_transfer_.handle_message(message, source);
            break;
        case MessageType::VIDEO:
            sink_.on_video_frame(std::get<VideoFrameMessage>(message).frame);
            break;
        case MessageType::SYSTEM:
            LOG_CLIENT_DEBUG("System message from host: " << std::get<SystemMessage>(message).content);
            break;
    }
}

void SessionManager::disconnect() {
    if (role_.load() == SessionRole::HOST) {
        stop_host();
        return;
    }
    if (role_.load() != SessionRole::CLIENT) {
        return;
    }

    running_.store(false);
    shutdown_all_threads();

    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(server_connection_mutex_);
        connection = server_connection_;
    }
    if (connection && connection->close()) {
        LOG_CLIENT_INFO("Disconnecting from " << connection->get_peer_address());
    }

    join_all_active_threads();
    finish_client_connection("Disconnected");
}

void SessionManager::finish_client_connection(const std::string& reason) {
    ClientState previous = client_state_.exchange(ClientState::DISCONNECTED);
    if (previous == ClientState::DISCONNECTED) {
        return;
    }

    file_transfer_.abort_all_receives(reason);
    if (previous != ClientState::IDLE) {
        sink_.on_connection_state(ConnectionState::DISCONNECTED);
    }
}

std::shared_ptr<Connection> SessionManager::get_server_connection() const {
    std::lock_guard<std::mutex> lock(server_connection_mutex_);
    return server_connection_;
}

bool SessionManager::send_to_host(const Message& message) {
    std::shared_ptr<Connection> connection = get_server_connection();
    if (!connection || client_state_.load() != ClientState::CONNECTED) {
        LOG_CLIENT_WARN("Cannot send " << message_type_name(get_message_type(message)) << ": not connected");
        return false;
    }

    try {
        connection->send(message);
        return true;
    } catch (const ProtocolError& e) {
        LOG_CLIENT_ERROR("Cannot send " << message_type_name(get_message_type(message)) << ": " << e.what());
        return false;
    } catch (const ConnectionError& e) {
        std::string error = std::string("Send to host failed: ") + e.what();
        LOG_CLIENT_ERROR(error);
        sink_.on_connection_error(error);
        // The receive loop observes the close and reports the disconnect
        connection->close();
        return false;
    }
}

} // namespace lanmeet
