#include "framer.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>

#define LOG_FRAMER_DEBUG(message) LOG_DEBUG("framer", message)
#define LOG_FRAMER_WARN(message)  LOG_WARN("framer", message)

namespace lanmeet {

void write_frame_length(uint8_t* out, uint32_t length) {
    out[0] = static_cast<uint8_t>((length >> 24) & 0xFF);
    out[1] = static_cast<uint8_t>((length >> 16) & 0xFF);
    out[2] = static_cast<uint8_t>((length >> 8) & 0xFF);
    out[3] = static_cast<uint8_t>(length & 0xFF);
}

uint32_t read_frame_length(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

std::vector<uint8_t> build_frame(const std::vector<uint8_t>& payload) {
    if (payload.size() > MAX_FRAME_SIZE) {
        throw ProtocolError("Payload of " + std::to_string(payload.size()) +
                            " bytes exceeds the maximum frame size");
    }

    std::vector<uint8_t> frame(FRAME_HEADER_SIZE + payload.size());
    write_frame_length(frame.data(), static_cast<uint32_t>(payload.size()));
    std::copy(payload.begin(), payload.end(), frame.begin() + FRAME_HEADER_SIZE);
    return frame;
}

std::vector<uint8_t> build_message_frame(const Message& message) {
    return build_frame(encode_message(message));
}

void send_frame(socket_t socket, const std::vector<uint8_t>& frame) {
    if (!send_all(socket, frame.data(), frame.size())) {
        throw ConnectionError("Failed to write " + std::to_string(frame.size()) +
                              " byte frame: " + last_socket_error());
    }
}

void send_message(socket_t socket, const Message& message) {
    send_frame(socket, build_message_frame(message));
    LOG_FRAMER_DEBUG("Sent " << message_type_name(get_message_type(message)) << " message on socket " << socket);
}

std::vector<uint8_t> receive_frame(socket_t socket) {
    uint8_t header[FRAME_HEADER_SIZE];
    long result = receive_exact_bytes(socket, header, FRAME_HEADER_SIZE);
    if (result == 0) {
        throw ConnectionClosed("Peer closed the connection");
    }
    if (result < 0) {
        throw ConnectionError("Failed to read frame header: " + last_socket_error());
    }

    uint32_t length = read_frame_length(header);
    if (length > MAX_FRAME_SIZE) {
        LOG_FRAMER_WARN("Rejecting frame of " << length << " bytes on socket " << socket);
        throw ProtocolError("Frame length " + std::to_string(length) + " exceeds the maximum frame size", false);
    }

    std::vector<uint8_t> payload(length);
    if (length > 0) {
        result = receive_exact_bytes(socket, payload.data(), length);
        if (result == 0) {
            throw ConnectionClosed("Connection closed mid-frame (" + std::to_string(length) + " bytes expected)");
        }
        if (result < 0) {
            throw ConnectionError("Failed to read frame payload: " + last_socket_error());
        }
    }
    return payload;
}

Message receive_message(socket_t socket) {
    std::vector<uint8_t> payload = receive_frame(socket);
    Message message = decode_message(payload);
    LOG_FRAMER_DEBUG("Received " << message_type_name(get_message_type(message))
                     << " message (" << payload.size() << " bytes) on socket " << socket);
    return message;
}

} // namespace lanmeet
