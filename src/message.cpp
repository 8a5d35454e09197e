#include "message.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>

namespace lanmeet {

const char* const HANDSHAKE_CONTENT = "connection_confirmed";

namespace {

const std::string& require_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ProtocolError(std::string("Missing or non-string field '") + key + "'");
    }
    return it->get_ref<const std::string&>();
}

uint64_t require_unsigned(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_number_unsigned()) {
        throw ProtocolError(std::string("Missing or non-unsigned field '") + key + "'");
    }
    return it->get<uint64_t>();
}

std::vector<uint8_t> require_binary(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_binary()) {
        throw ProtocolError(std::string("Missing or non-binary field '") + key + "'");
    }
    const auto& bin = it->get_binary();
    return std::vector<uint8_t>(bin.begin(), bin.end());
}

struct Encoder {
    nlohmann::json operator()(const SystemMessage& m) const {
        return {{"type", "system"}, {"content", m.content}, {"timestamp", m.timestamp}};
    }
    nlohmann::json operator()(const ChatMessage& m) const {
        return {{"type", "chat"}, {"content", m.content}, {"timestamp", m.timestamp}, {"sender", m.sender}};
    }
    nlohmann::json operator()(const FileInfoMessage& m) const {
        return {{"type", "file_info"}, {"transfer_id", m.transfer_id}, {"name", m.name},
                {"size", m.size}, {"digest", m.digest}};
    }
    nlohmann::json operator()(const FileDataMessage& m) const {
        return {{"type", "file_data"}, {"transfer_id", m.transfer_id},
                {"chunk", nlohmann::json::binary(m.chunk)}};
    }
    nlohmann::json operator()(const FileEndMessage& m) const {
        return {{"type", "file_end"}, {"transfer_id", m.transfer_id}, {"digest", m.digest}};
    }
    nlohmann::json operator()(const VideoFrameMessage& m) const {
        return {{"type", "video"}, {"frame", nlohmann::json::binary(m.frame)}};
    }
};

} // namespace

bool operator==(const SystemMessage& a, const SystemMessage& b) {
    return a.content == b.content && a.timestamp == b.timestamp;
}

bool operator==(const ChatMessage& a, const ChatMessage& b) {
    return a.content == b.content && a.timestamp == b.timestamp && a.sender == b.sender;
}

bool operator==(const FileInfoMessage& a, const FileInfoMessage& b) {
    return a.transfer_id == b.transfer_id && a.name == b.name && a.size == b.size && a.digest == b.digest;
}

bool operator==(const FileDataMessage& a, const FileDataMessage& b) {
    return a.transfer_id == b.transfer_id && a.chunk == b.chunk;
}

bool operator==(const FileEndMessage& a, const FileEndMessage& b) {
    return a.transfer_id == b.transfer_id && a.digest == b.digest;
}

bool operator==(const VideoFrameMessage& a, const VideoFrameMessage& b) {
    return a.frame == b.frame;
}

MessageType get_message_type(const Message& message) {
    switch (message.index()) {
        case 0: return MessageType::SYSTEM;
        case 1: return MessageType::CHAT;
        case 2: return MessageType::FILE_INFO;
        case 3: return MessageType::FILE_DATA;
        case 4: return MessageType::FILE_END;
        default: return MessageType::VIDEO;
    }
}

const char* message_type_name(MessageType type) {
    switch (type) {
        case MessageType::SYSTEM:    return "system";
        case MessageType::CHAT:      return "chat";
        case MessageType::FILE_INFO: return "file_info";
        case MessageType::FILE_DATA: return "file_data";
        case MessageType::FILE_END:  return "file_end";
        case MessageType::VIDEO:     return "video";
        default: return "unknown";
    }
}

bool parse_message_type(const std::string& name, MessageType& out) {
    static const MessageType all_types[] = {
        MessageType::SYSTEM, MessageType::CHAT, MessageType::FILE_INFO,
        MessageType::FILE_DATA, MessageType::FILE_END, MessageType::VIDEO
    };
    for (MessageType type : all_types) {
        if (name == message_type_name(type)) {
            out = type;
            return true;
        }
    }
    return false;
}

std::vector<uint8_t> encode_message(const Message& message) {
    nlohmann::json j = std::visit(Encoder{}, message);
    return nlohmann::json::to_msgpack(j);
}

Message decode_message(const uint8_t* data, size_t size) {
    nlohmann::json j;
    try {
        j = nlohmann::json::from_msgpack(data, data + size);
    } catch (const nlohmann::json::exception& e) {
        throw ProtocolError(std::string("Undecodable payload: ") + e.what());
    }

    if (!j.is_object()) {
        throw ProtocolError("Payload is not a map");
    }

    const std::string& tag = require_string(j, "type");
    MessageType type;
    if (!parse_message_type(tag, type)) {
        throw ProtocolError("Unknown message type '" + tag + "'");
    }

    switch (type) {
        case MessageType::SYSTEM: {
            SystemMessage m;
            m.content = require_string(j, "content");
            m.timestamp = require_string(j, "timestamp");
            return m;
        }
        case MessageType::CHAT: {
            ChatMessage m;
            m.content = require_string(j, "content");
            m.timestamp = require_string(j, "timestamp");
            m.sender = require_string(j, "sender");
            return m;
        }
        case MessageType::FILE_INFO: {
            FileInfoMessage m;
            m.transfer_id = require_string(j, "transfer_id");
            m.name = require_string(j, "name");
            m.size = require_unsigned(j, "size");
            m.digest = require_string(j, "digest");
            return m;
        }
        case MessageType::FILE_DATA: {
            FileDataMessage m;
            m.transfer_id = require_string(j, "transfer_id");
            m.chunk = require_binary(j, "chunk");
            return m;
        }
        case MessageType::FILE_END: {
            FileEndMessage m;
            m.transfer_id = require_string(j, "transfer_id");
            m.digest = require_string(j, "digest");
            return m;
        }
        case MessageType::VIDEO: {
            VideoFrameMessage m;
            m.frame = require_binary(j, "frame");
            return m;
        }
    }
    throw ProtocolError("Unhandled message type '" + tag + "'");
}

Message decode_message(const std::vector<uint8_t>& payload) {
    return decode_message(payload.data(), payload.size());
}

SystemMessage make_handshake_message() {
    SystemMessage m;
    m.content = HANDSHAKE_CONTENT;
    m.timestamp = format_current_time("%Y-%m-%d %H:%M:%S");
    return m;
}

bool is_handshake_message(const Message& message) {
    const SystemMessage* system = std::get_if<SystemMessage>(&message);
    return system != nullptr && system->content == HANDSHAKE_CONTENT;
}

ChatMessage make_chat_message(const std::string& sender, const std::string& content) {
    ChatMessage m;
    m.content = content;
    m.timestamp = format_current_time("%H:%M:%S");
    m.sender = sender;
    return m;
}

std::string format_current_time(const char* format) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif
    char buffer[64];
    size_t written = std::strftime(buffer, sizeof(buffer), format, &tm_buf);
    return std::string(buffer, written);
}

} // namespace lanmeet
