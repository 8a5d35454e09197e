#include "connection.h"
#include "errors.h"
#include "framer.h"
#include "logger.h"

#define LOG_CONNECTION_DEBUG(message) LOG_DEBUG("connection", message)

namespace lanmeet {

Connection::Connection(socket_t socket, const std::string& peer_address, ConnectionRole role)
    : socket_(socket), peer_address_(peer_address), role_(role), closed_(false) {
}

Connection::~Connection() {
    close();
    close_socket(socket_);
}

void Connection::send(const Message& message) {
    send_frame(build_message_frame(message));
}

void Connection::send_frame(const std::vector<uint8_t>& frame) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (closed_.load()) {
        throw ConnectionError("Connection to " + peer_address_ + " is closed");
    }
    lanmeet::send_frame(socket_, frame);
}

Message Connection::receive() {
    return receive_message(socket_);
}

bool Connection::close() {
    bool expected = false;
    if (!closed_.compare_exchange_strong(expected, true)) {
        return false;
    }
    LOG_CONNECTION_DEBUG("Closing connection to " << peer_address_);
    shutdown_socket(socket_);
    return true;
}

} // namespace lanmeet
