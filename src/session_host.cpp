#include "session.h"
#include "errors.h"
#include "log_macros.h"

namespace lanmeet {

bool SessionManager::create_session() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (role_.load() != SessionRole::NONE) {
        LOG_HOST_ERROR("Session already started as " << session_role_name(role_.load()));
        return false;
    }

    if (!init_socket_library()) {
        sink_.on_connection_error("Failed to initialize the socket library");
        return false;
    }

    socket_t server_socket = create_tcp_server(config_.bind_address, config_.port, config_.listen_backlog);
    if (!is_valid_socket(server_socket)) {
        std::string message = "Failed to listen on " + config_.bind_address + ":" + std::to_string(config_.port);
        LOG_HOST_ERROR(message);
        sink_.on_connection_error(message);
        return false;
    }

    listen_socket_ = server_socket;
    listen_port_.store(get_bound_port(server_socket));
    registry_.set_listen_socket(server_socket);

    role_.store(SessionRole::HOST);
    host_state_.store(HostState::LISTENING);
    running_.store(true);

    if (!add_managed_thread([this]() { accept_loop(); }, "accept-loop")) {
        LOG_HOST_ERROR("Cannot start the accept loop while shutting down");
        running_.store(false);
        registry_.stop();
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
        host_state_.store(HostState::CLOSED);
        return false;
    }

    LOG_HOST_INFO("Session created on " << config_.bind_address << ":" << listen_port_.load());
    sink_.on_connection_state(ConnectionState::CONNECTED);
    return true;
}

void SessionManager::accept_loop() {
    LOG_HOST_INFO("Accept loop started");

    while (running_.load()) {
        socket_t client_socket = accept_client(listen_socket_);
        if (!is_valid_socket(client_socket)) {
            if (running_.load()) {
                std::string message = "Accepting connections failed: " + last_socket_error();
                LOG_HOST_ERROR(message);
                sink_.on_connection_error(message);
                running_.store(false);
                registry_.stop();
                enter_host_closed();
            }
            break;
        }

        std::string peer_address = get_peer_address(client_socket);
        if (peer_address.empty()) {
            peer_address = "socket " + std::to_string(client_socket);
        }
        auto connection = std::make_shared<Connection>(client_socket, peer_address, ConnectionRole::HOST_SIDE_PEER);

        try {
            send_handshake(*connection);
        } catch (const ConnectionError& e) {
            LOG_HOST_WARN("Dropping " << peer_address << ", handshake could not be sent: " << e.what());
            continue;
        }

        registry_.add(connection);
        // stop() may have emptied the registry between accept() and add()
        if (!running_.load()) {
            registry_.remove(connection);
            connection->close();
            break;
        }

        LOG_HOST_INFO("Client joined from " << peer_address << " (clients: " << registry_.size() << ")");
        sink_.on_peer_joined(peer_address);
        if (!add_managed_thread([this, connection]() { handle_client(connection); },
                                "client-handler: " + peer_address)) {
            registry_.remove(connection);
            connection->close();
            break;
        }
    }

    LOG_HOST_INFO("Accept loop ended");
}

void SessionManager::send_handshake(Connection& connection) {
    connection.send(make_handshake_message());
}

void SessionManager::handle_client(std::shared_ptr<Connection> connection) {
    const std::string peer_address = connection->get_peer_address();
    LOG_HOST_DEBUG("Started handling client " << peer_address);

    while (running_.load()) {
        Message message;
        try {
            message = connection->receive();
        } catch (const ProtocolError& e) {
            if (e.stream_intact()) {
                LOG_HOST_WARN("Skipping malformed message from " << peer_address << ": " << e.what());
                continue;
            }
            LOG_HOST_ERROR("Closing " << peer_address << " after unrecoverable protocol error: " << e.what());
            break;
        } catch (const ConnectionClosed&) {
            LOG_HOST_INFO("Client " << peer_address << " closed the connection");
            break;
        } catch (const ConnectionError& e) {
            if (!connection->is_closed()) {
                LOG_HOST_WARN("Connection to " << peer_address << " failed: " << e.what());
            }
            break;
        }

        handle_host_message(connection, message);
    }

    bool removed = registry_.remove(connection);
    connection->close();
    file_transfer_.abort_transfers_from(peer_address, "Connection to " + peer_address + " closed");
    if (removed) {
        sink_.on_peer_left(peer_address, false);
    }
    LOG_HOST_DEBUG("Finished handling client " << peer_address);
}

void SessionManager::handle_host_message(const std::shared_ptr<Connection>& connection, const Message& message) {
    switch (get_message_type(message)) {
        case MessageType::CHAT: {
            const auto& chat = std::get<ChatMessage>(message);
            registry_.broadcast(message, connection.get());
            sink_.on_chat(chat.sender, chat.content);
            break;
        }
        case MessageType::FILE_INFO:
        case MessageType::FILE_DATA:
        case MessageType::FILE_END:
            file_transfer_.handle_message(message, connection->get_peer_address());
            break;
        case MessageType::VIDEO: {
            const auto& video = std::get<VideoFrameMessage>(message);
            registry_.broadcast(message, connection.get());
            sink_.on_video_frame(video.frame);
            break;
        }
        case MessageType::SYSTEM:
            LOG_HOST_DEBUG("Ignoring system message from " << connection->get_peer_address());
            break;
    }
}

void SessionManager::stop_host() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (running_.exchange(false)) {
        LOG_HOST_INFO("Stopping session");
    }

    registry_.stop();
    shutdown_all_threads();
    join_all_active_threads();

    if (is_valid_socket(listen_socket_)) {
        close_socket(listen_socket_);
        listen_socket_ = INVALID_SOCKET_VALUE;
    }

    enter_host_closed();
}

void SessionManager::enter_host_closed() {
    HostState previous = host_state_.exchange(HostState::CLOSED);
    if (previous == HostState::LISTENING) {
        LOG_HOST_INFO("Session closed");
        sink_.on_connection_state(ConnectionState::DISCONNECTED);
    }
}

} // namespace lanmeet
