#include "client_registry.h"
#include "errors.h"
#include "framer.h"
#include "logger.h"
#include <algorithm>

#define LOG_REGISTRY_DEBUG(message) LOG_DEBUG("registry", message)
#define LOG_REGISTRY_INFO(message)  LOG_INFO("registry", message)
#define LOG_REGISTRY_WARN(message)  LOG_WARN("registry", message)
#define LOG_REGISTRY_ERROR(message) LOG_ERROR("registry", message)

namespace lanmeet {

ClientRegistry::ClientRegistry(EventSink* sink)
    : listen_socket_(INVALID_SOCKET_VALUE), sink_(sink) {
}

ClientRegistry::~ClientRegistry() {
    stop();
}

void ClientRegistry::add(const std::shared_ptr<Connection>& connection) {
    if (!connection) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(connections_.begin(), connections_.end(), connection) != connections_.end()) {
        return;
    }
    connections_.push_back(connection);
    LOG_REGISTRY_DEBUG("Added " << connection->get_peer_address() << " (total: " << connections_.size() << ")");
}

bool ClientRegistry::remove(const std::shared_ptr<Connection>& connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(connections_.begin(), connections_.end(), connection);
    if (it == connections_.end()) {
        return false;
    }
    connections_.erase(it);
    LOG_REGISTRY_DEBUG("Removed " << connection->get_peer_address() << " (total: " << connections_.size() << ")");
    return true;
}

bool ClientRegistry::contains(const std::shared_ptr<Connection>& connection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::find(connections_.begin(), connections_.end(), connection) != connections_.end();
}

size_t ClientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::vector<std::shared_ptr<Connection>> ClientRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

int ClientRegistry::broadcast(const Message& message, const Connection* exclude) {
    std::vector<uint8_t> frame;
    try {
        frame = build_message_frame(message);
    } catch (const ProtocolError& e) {
        LOG_REGISTRY_ERROR("Cannot broadcast " << message_type_name(get_message_type(message))
                           << " message: " << e.what());
        return 0;
    }
    return broadcast_frame(frame, exclude);
}

int ClientRegistry::broadcast_frame(const std::vector<uint8_t>& frame, const Connection* exclude) {
    int sent = 0;
    for (const auto& connection : snapshot()) {
        if (connection.get() == exclude) {
            continue;
        }
        try {
            connection->send_frame(frame);
            sent++;
        } catch (const ConnectionError& e) {
            LOG_REGISTRY_WARN("Dropping " << connection->get_peer_address() << " after failed send: " << e.what());
            // Only the thread that actually removes it reports the loss
            if (remove(connection)) {
                connection->close();
                if (sink_) {
                    sink_->on_peer_left(connection->get_peer_address(), true);
                }
            }
        }
    }
    return sent;
}

void ClientRegistry::set_listen_socket(socket_t socket) {
    std::lock_guard<std::mutex> lock(mutex_);
    listen_socket_ = socket;
}

void ClientRegistry::stop() {
    std::vector<std::shared_ptr<Connection>> to_close;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_valid_socket(listen_socket_)) {
            shutdown_socket(listen_socket_);
            listen_socket_ = INVALID_SOCKET_VALUE;
        }
        to_close.swap(connections_);
    }

    if (!to_close.empty()) {
        LOG_REGISTRY_INFO("Closing " << to_close.size() << " client connections");
    }
    for (auto& connection : to_close) {
        connection->close();
    }
}

} // namespace lanmeet
