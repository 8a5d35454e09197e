#include <gtest/gtest.h>
#include "framer.h"
#include "errors.h"
#include "socket.h"
#include "loopback.h"
#include <algorithm>
#include <thread>

using namespace lanmeet;

class FramerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(init_socket_library());
        ASSERT_TRUE(lanmeet_test::make_loopback_pair(writer_, reader_));
    }

    void TearDown() override {
        if (is_valid_socket(writer_)) close_socket(writer_);
        if (is_valid_socket(reader_)) close_socket(reader_);
    }

    void write_raw(const std::vector<uint8_t>& bytes) {
        ASSERT_TRUE(send_all(writer_, bytes.data(), bytes.size()));
    }

    void close_writer() {
        close_socket(writer_);
        writer_ = INVALID_SOCKET_VALUE;
    }

    socket_t writer_ = INVALID_SOCKET_VALUE;
    socket_t reader_ = INVALID_SOCKET_VALUE;
};

TEST_F(FramerTest, PrefixIsBigEndianPayloadLength) {
    std::vector<uint8_t> payload(0x010203, 0xAB);
    std::vector<uint8_t> frame = build_frame(payload);

    ASSERT_EQ(frame.size(), payload.size() + FRAME_HEADER_SIZE);
    EXPECT_EQ(frame[0], 0x00);
    EXPECT_EQ(frame[1], 0x01);
    EXPECT_EQ(frame[2], 0x02);
    EXPECT_EQ(frame[3], 0x03);
    EXPECT_EQ(read_frame_length(frame.data()), payload.size());
}

TEST_F(FramerTest, MessageFramePrefixMatchesEncodedLength) {
    ChatMessage chat = make_chat_message("alice", "hello");
    std::vector<uint8_t> encoded = encode_message(chat);
    std::vector<uint8_t> frame = build_message_frame(chat);

    EXPECT_EQ(read_frame_length(frame.data()), encoded.size());
    EXPECT_TRUE(std::equal(encoded.begin(), encoded.end(), frame.begin() + FRAME_HEADER_SIZE));
}

TEST_F(FramerTest, SendAndReceiveMessages) {
    ChatMessage chat = make_chat_message("alice", "first");
    FileEndMessage end;
    end.transfer_id = "abc";
    end.digest = "0123";

    send_message(writer_, chat);
    send_message(writer_, end);

    EXPECT_EQ(receive_message(reader_), Message(chat));
    EXPECT_EQ(receive_message(reader_), Message(end));
}

TEST_F(FramerTest, LargeFrameArrivesWhole) {
    VideoFrameMessage video;
    video.frame.resize(3 * 1024 * 1024);
    for (size_t i = 0; i < video.frame.size(); ++i) {
        video.frame[i] = static_cast<uint8_t>(i * 31);
    }

    // Larger than the socket buffer, so write from another thread
    std::thread sender([&]() { send_message(writer_, video); });
    Message received = receive_message(reader_);
    sender.join();

    EXPECT_EQ(received, Message(video));
}

TEST_F(FramerTest, CloseBeforeFrameIsConnectionClosed) {
    close_writer();
    EXPECT_THROW(receive_frame(reader_), ConnectionClosed);
}

TEST_F(FramerTest, CloseInsideHeaderIsConnectionClosed) {
    write_raw({0x00, 0x00});
    close_writer();
    EXPECT_THROW(receive_frame(reader_), ConnectionClosed);
}

TEST_F(FramerTest, TruncatedPayloadIsConnectionClosed) {
    std::vector<uint8_t> partial = {0x00, 0x00, 0x00, 0x64};
    partial.resize(partial.size() + 10, 0x11);
    write_raw(partial);
    close_writer();
    EXPECT_THROW(receive_frame(reader_), ConnectionClosed);
}

TEST_F(FramerTest, OversizedLengthIsUnrecoverableProtocolError) {
    write_raw({0xFF, 0xFF, 0xFF, 0xFF});
    try {
        receive_frame(reader_);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_FALSE(e.stream_intact());
    }
}

TEST_F(FramerTest, BuildFrameRejectsOversizedPayload) {
    std::vector<uint8_t> payload(static_cast<size_t>(MAX_FRAME_SIZE) + 1);
    EXPECT_THROW(build_frame(payload), ProtocolError);
}

TEST_F(FramerTest, UndecodablePayloadLeavesNextFrameReadable) {
    write_raw(build_frame({0xC1, 0xC1, 0xC1}));
    SystemMessage system;
    system.content = "after";
    system.timestamp = "now";
    send_message(writer_, system);

    try {
        receive_message(reader_);
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_TRUE(e.stream_intact());
    }
    EXPECT_EQ(receive_message(reader_), Message(system));
}

TEST_F(FramerTest, EmptyPayloadFrame) {
    write_raw(build_frame({}));
    EXPECT_TRUE(receive_frame(reader_).empty());
}

TEST_F(FramerTest, WriteToClosedPeerIsConnectionError) {
    close_socket(reader_);
    reader_ = INVALID_SOCKET_VALUE;

    std::vector<uint8_t> frame = build_frame(std::vector<uint8_t>(1024, 0x01));
    EXPECT_THROW({
        // The first write may still be buffered; keep writing until the reset surfaces
        for (int i = 0; i < 1000; ++i) {
            send_frame(writer_, frame);
        }
    }, ConnectionError);
}
