#include <gtest/gtest.h>
#include "message.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <regex>

using namespace lanmeet;

namespace {

std::vector<uint8_t> pack(const nlohmann::json& j) {
    return nlohmann::json::to_msgpack(j);
}

} // namespace

TEST(MessageTest, ChatRoundTrip) {
    ChatMessage chat;
    chat.content = "hello, 世界";
    chat.timestamp = "12:34:56";
    chat.sender = "alice";

    Message decoded = decode_message(encode_message(chat));
    ASSERT_TRUE(std::holds_alternative<ChatMessage>(decoded));
    EXPECT_EQ(std::get<ChatMessage>(decoded), chat);
}

TEST(MessageTest, FileMessagesRoundTrip) {
    FileInfoMessage info;
    info.transfer_id = "0123456789abcdef0123456789abcdef";
    info.name = "report.pdf";
    info.size = 5ull * 1024 * 1024 * 1024;
    info.digest = "d41d8cd98f00b204e9800998ecf8427e";
    EXPECT_EQ(decode_message(encode_message(info)), Message(info));

    FileDataMessage data;
    data.transfer_id = info.transfer_id;
    for (int i = 0; i < 256; ++i) {
        data.chunk.push_back(static_cast<uint8_t>(i));
    }
    EXPECT_EQ(decode_message(encode_message(data)), Message(data));

    FileEndMessage end;
    end.transfer_id = info.transfer_id;
    end.digest = info.digest;
    EXPECT_EQ(decode_message(encode_message(end)), Message(end));
}

TEST(MessageTest, EmptyChunkAndVideoFrameSurvive) {
    FileDataMessage data;
    data.transfer_id = "id";
    EXPECT_EQ(decode_message(encode_message(data)), Message(data));

    VideoFrameMessage video;
    video.frame = {0xFF, 0xD8, 0xFF, 0xE0, 0x00};
    EXPECT_EQ(decode_message(encode_message(video)), Message(video));
}

TEST(MessageTest, PayloadIsTaggedMap) {
    SystemMessage system = make_handshake_message();
    nlohmann::json j = nlohmann::json::from_msgpack(encode_message(system));

    ASSERT_TRUE(j.is_object());
    EXPECT_EQ(j["type"], "system");
    EXPECT_EQ(j["content"], "connection_confirmed");
    EXPECT_TRUE(j["timestamp"].is_string());
}

TEST(MessageTest, UnknownTagIsProtocolError) {
    auto payload = pack({{"type", "screen_share"}, {"content", "x"}});
    EXPECT_THROW(decode_message(payload), ProtocolError);
}

TEST(MessageTest, MissingTagIsProtocolError) {
    auto payload = pack({{"content", "x"}, {"timestamp", "t"}});
    EXPECT_THROW(decode_message(payload), ProtocolError);
}

TEST(MessageTest, MissingFieldIsProtocolError) {
    auto payload = pack({{"type", "chat"}, {"content", "hi"}, {"timestamp", "12:00:00"}});
    EXPECT_THROW(decode_message(payload), ProtocolError);
}

TEST(MessageTest, IllTypedFieldIsProtocolError) {
    // size must be an unsigned integer
    auto info = pack({{"type", "file_info"}, {"transfer_id", "id"}, {"name", "a"},
                      {"size", "12"}, {"digest", "x"}});
    EXPECT_THROW(decode_message(info), ProtocolError);

    // chunk must be binary, not an array of numbers
    auto data = pack({{"type", "file_data"}, {"transfer_id", "id"}, {"chunk", {1, 2, 3}}});
    EXPECT_THROW(decode_message(data), ProtocolError);
}

TEST(MessageTest, GarbageIsProtocolError) {
    std::vector<uint8_t> garbage = {0xC1, 0x00, 0x17};
    EXPECT_THROW(decode_message(garbage), ProtocolError);

    // Valid MessagePack, but not a map
    EXPECT_THROW(decode_message(pack(nlohmann::json::array({1, 2}))), ProtocolError);

    EXPECT_THROW(decode_message(std::vector<uint8_t>()), ProtocolError);
}

TEST(MessageTest, ProtocolErrorFromDecodeKeepsStreamIntact) {
    try {
        decode_message(pack({{"type", "nope"}}));
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_TRUE(e.stream_intact());
    }
}

TEST(MessageTest, HandshakeDetection) {
    EXPECT_TRUE(is_handshake_message(make_handshake_message()));

    SystemMessage other;
    other.content = "welcome";
    EXPECT_FALSE(is_handshake_message(other));

    ChatMessage chat;
    chat.content = HANDSHAKE_CONTENT;
    EXPECT_FALSE(is_handshake_message(chat));
}

TEST(MessageTest, ChatFactoryStampsLocalTime) {
    ChatMessage chat = make_chat_message("bob", "hi");
    EXPECT_EQ(chat.sender, "bob");
    EXPECT_EQ(chat.content, "hi");
    EXPECT_TRUE(std::regex_match(chat.timestamp, std::regex("[0-9]{2}:[0-9]{2}:[0-9]{2}")))
        << chat.timestamp;
}

TEST(MessageTest, TypeNames) {
    EXPECT_STREQ(message_type_name(get_message_type(Message(FileEndMessage()))), "file_end");
    EXPECT_STREQ(message_type_name(get_message_type(Message(VideoFrameMessage()))), "video");

    MessageType type;
    ASSERT_TRUE(parse_message_type("file_info", type));
    EXPECT_EQ(type, MessageType::FILE_INFO);
    EXPECT_FALSE(parse_message_type("FILE_INFO", type));
}
