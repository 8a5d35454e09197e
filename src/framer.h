#pragma once

#include "message.h"
#include "socket.h"
#include <cstdint>
#include <vector>

namespace lanmeet {

// Every frame: 4-byte big-endian payload length, then exactly that many bytes
constexpr size_t FRAME_HEADER_SIZE = 4;

// Largest payload a peer may announce; anything above is a malformed length
constexpr uint32_t MAX_FRAME_SIZE = 64u * 1024u * 1024u;

void write_frame_length(uint8_t* out, uint32_t length);
uint32_t read_frame_length(const uint8_t* in);

/**
 * Prefix a payload with its length
 * @throws ProtocolError if the payload exceeds MAX_FRAME_SIZE
 */
std::vector<uint8_t> build_frame(const std::vector<uint8_t>& payload);

// Encode a message and prefix it, ready for one or many send_frame() calls
std::vector<uint8_t> build_message_frame(const Message& message);

/**
 * Write a complete frame (prefix included)
 * @throws ConnectionError if the write cannot complete
 */
void send_frame(socket_t socket, const std::vector<uint8_t>& frame);

/**
 * Serialize and write one message
 * @throws ConnectionError if the write cannot complete
 */
void send_message(socket_t socket, const Message& message);

/**
 * Read one frame and return its payload (prefix stripped)
 * @throws ConnectionClosed on a zero-length read, before or inside the frame
 * @throws ConnectionError on any other read failure
 * @throws ProtocolError (stream not intact) if the length exceeds MAX_FRAME_SIZE
 */
std::vector<uint8_t> receive_frame(socket_t socket);

/**
 * Read and decode one message
 * @throws ConnectionClosed, ConnectionError as receive_frame()
 * @throws ProtocolError if the length is malformed or the payload does not decode
 */
Message receive_message(socket_t socket);

} // namespace lanmeet
