#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace lanmeet {

/**
 * Message kinds carried on the wire. The string form ("system", "chat", ...)
 * is what appears in the payload's "type" field.
 */
enum class MessageType {
    SYSTEM,
    CHAT,
    FILE_INFO,
    FILE_DATA,
    FILE_END,
    VIDEO
};

// Content of the system message a host sends right after accepting a connection
extern const char* const HANDSHAKE_CONTENT;

struct SystemMessage {
    std::string content;
    std::string timestamp;
};

struct ChatMessage {
    std::string content;
    std::string timestamp;
    std::string sender;
};

/**
 * Announces a transfer. digest is the lowercase hex MD5 of the whole file.
 */
struct FileInfoMessage {
    std::string transfer_id;
    std::string name;
    uint64_t size = 0;
    std::string digest;
};

struct FileDataMessage {
    std::string transfer_id;
    std::vector<uint8_t> chunk;
};

struct FileEndMessage {
    std::string transfer_id;
    std::string digest;
};

// Opaque encoded camera frame, relayed but never decoded
struct VideoFrameMessage {
    std::vector<uint8_t> frame;
};

using Message = std::variant<SystemMessage, ChatMessage, FileInfoMessage,
                             FileDataMessage, FileEndMessage, VideoFrameMessage>;

bool operator==(const SystemMessage& a, const SystemMessage& b);
bool operator==(const ChatMessage& a, const ChatMessage& b);
bool operator==(const FileInfoMessage& a, const FileInfoMessage& b);
bool operator==(const FileDataMessage& a, const FileDataMessage& b);
bool operator==(const FileEndMessage& a, const FileEndMessage& b);
bool operator==(const VideoFrameMessage& a, const VideoFrameMessage& b);

MessageType get_message_type(const Message& message);
const char* message_type_name(MessageType type);

/**
 * Map a wire tag to its MessageType
 * @return false if the tag is not one we know
 */
bool parse_message_type(const std::string& name, MessageType& out);

/**
 * Serialize a message into its self-describing payload (a MessagePack map).
 * The result carries no length prefix.
 */
std::vector<uint8_t> encode_message(const Message& message);

/**
 * Decode a payload produced by encode_message().
 * @throws ProtocolError if the bytes are not a MessagePack map, the "type" tag is
 *         unknown, or a required field is missing or has the wrong type
 */
Message decode_message(const uint8_t* data, size_t size);
Message decode_message(const std::vector<uint8_t>& payload);

// Handshake helpers
SystemMessage make_handshake_message();
bool is_handshake_message(const Message& message);

// Factory for chat messages stamped with the current local time (HH:MM:SS)
ChatMessage make_chat_message(const std::string& sender, const std::string& content);

/**
 * Current local time formatted with strftime()
 * @param format e.g. "%Y-%m-%d %H:%M:%S"
 */
std::string format_current_time(const char* format);

} // namespace lanmeet
