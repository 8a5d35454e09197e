#include "session.h"
#include "errors.h"
#include "log_macros.h"

namespace lanmeet {

const char* session_role_name(SessionRole role) {
    switch (role) {
        case SessionRole::NONE:   return "none";
        case SessionRole::HOST:   return "host";
        case SessionRole::CLIENT: return "client";
    }
    return "unknown";
}

const char* host_state_name(HostState state) {
    switch (state) {
        case HostState::IDLE:      return "idle";
        case HostState::LISTENING: return "listening";
        case HostState::CLOSED:    return "closed";
    }
    return "unknown";
}

const char* client_state_name(ClientState state) {
    switch (state) {
        case ClientState::IDLE:         return "idle";
        case ClientState::CONNECTING:   return "connecting";
        case ClientState::CONNECTED:    return "connected";
        case ClientState::DISCONNECTED: return "disconnected";
    }
    return "unknown";
}

SessionManager::SessionManager(EventSink& sink, const SessionConfig& config)
    : ThreadManager(),
      sink_(sink),
      config_(config),
      role_(SessionRole::NONE),
      host_state_(HostState::IDLE),
      client_state_(ClientState::IDLE),
      running_(false),
      listen_socket_(INVALID_SOCKET_VALUE),
      listen_port_(0),
      registry_(&sink),
      file_transfer_(sink, *this, config.chunk_size) {
    if (config_.retry_count < 1) {
        config_.retry_count = 1;
    }
}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::stop() {
    switch (role_.load()) {
        case SessionRole::HOST:
            stop_host();
            break;
        case SessionRole::CLIENT:
            disconnect();
            break;
        case SessionRole::NONE:
            break;
    }
}

bool SessionManager::send_chat(const std::string& text) {
    ChatMessage chat = make_chat_message(get_display_name(), text);

    switch (role_.load()) {
        case SessionRole::HOST: {
            if (host_state_.load() != HostState::LISTENING) {
                LOG_HOST_WARN("Cannot send chat: session is not running");
                return false;
            }
            int delivered = registry_.broadcast(chat);
            LOG_HOST_DEBUG("Chat delivered to " << delivered << " clients");
            break;
        }
        case SessionRole::CLIENT:
            if (!send_to_host(chat)) {
                return false;
            }
            break;
        case SessionRole::NONE:
            LOG_WARN("session", "Cannot send chat: no session");
            return false;
    }

    sink_.on_chat(chat.sender, chat.content);
    return true;
}

bool SessionManager::send_file(const std::string& path) {
    switch (role_.load()) {
        case SessionRole::HOST:
            if (host_state_.load() != HostState::LISTENING) {
                LOG_HOST_WARN("Cannot send file: session is not running");
                return false;
            }
            if (registry_.size() == 0) {
                LOG_HOST_WARN("Cannot send " << path << ": no clients connected");
                return false;
            }
            break;
        case SessionRole::CLIENT:
            if (client_state_.load() != ClientState::CONNECTED) {
                LOG_CLIENT_WARN("Cannot send file: not connected");
                return false;
            }
            break;
        case SessionRole::NONE:
            LOG_WARN("session", "Cannot send file: no session");
            return false;
    }

    return file_transfer_.start_send(path, make_file_sender());
}

bool SessionManager::send_video_frame(const std::vector<uint8_t>& frame) {
    VideoFrameMessage video;
    video.frame = frame;

    switch (role_.load()) {
        case SessionRole::HOST:
            if (host_state_.load() != HostState::LISTENING) {
                return false;
            }
            return registry_.broadcast(video) > 0;
        case SessionRole::CLIENT:
            return send_to_host(video);
        case SessionRole::NONE:
            break;
    }
    return false;
}

MessageSender SessionManager::make_file_sender() {
    if (role_.load() == SessionRole::HOST) {
        return [this](const Message& message) {
            if (registry_.broadcast(message) == 0) {
                throw ConnectionError("No client left to receive the file");
            }
        };
    }

    std::shared_ptr<Connection> connection = get_server_connection();
    return [connection](const Message& message) {
        if (!connection) {
            throw ConnectionError("Not connected");
        }
        connection->send(message);
    };
}

size_t SessionManager::get_client_count() const {
    return registry_.size();
}

std::vector<std::string> SessionManager::get_peer_addresses() const {
    std::vector<std::string> addresses;
    if (role_.load() == SessionRole::HOST) {
        for (const auto& connection : registry_.snapshot()) {
            addresses.push_back(connection->get_peer_address());
        }
    } else if (auto connection = get_server_connection()) {
        if (!connection->is_closed()) {
            addresses.push_back(connection->get_peer_address());
        }
    }
    return addresses;
}

std::string SessionManager::get_display_name() const {
    if (!config_.display_name.empty()) {
        return config_.display_name;
    }
    return role_.load() == SessionRole::HOST ? "host" : "client";
}

} // namespace lanmeet
