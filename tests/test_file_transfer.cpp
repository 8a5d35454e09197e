#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "file_transfer.h"
#include "digest.h"
#include "errors.h"
#include "fs.h"
#include "recording_sink.h"
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <stdexcept>

using namespace lanmeet;

class FileTransferTest : public ::testing::Test {
protected:
    void SetUp() override {
        create_directories("test_transfer_data");
        sender_ = std::make_unique<FileTransferEngine>(sender_sink_, sender_threads_);
        receiver_ = std::make_unique<FileTransferEngine>(receiver_sink_, receiver_threads_);
    }

    void TearDown() override {
        sender_threads_.join_all_active_threads();
        sender_.reset();
        receiver_.reset();
        for (const auto& path : created_files_) {
            std::remove(path.c_str());
        }
    }

    std::string create_test_file(const std::string& name, size_t size) {
        std::string path = "test_transfer_data/" + name;
        std::ofstream file(path, std::ios::binary);
        for (size_t i = 0; i < size; ++i) {
            file.put(static_cast<char>((i * 7 + i / 251) & 0xFF));
        }
        file.close();
        created_files_.push_back(path);
        return path;
    }

    static std::vector<uint8_t> read_all(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        return std::vector<uint8_t>(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
    }

    // Records what the sender emits
    MessageSender capture() {
        return [this](const Message& message) {
            std::lock_guard<std::mutex> lock(captured_mutex_);
            captured_.push_back(message);
        };
    }

    void deliver_all() {
        for (const auto& message : captured_) {
            receiver_->handle_message(message, "10.0.0.9:9999");
        }
    }

    static void expect_well_formed_progress(const std::vector<RecordingSink::ProgressEvent>& progress,
                                            bool expect_complete) {
        int last = -1;
        int hundreds = 0;
        for (size_t i = 0; i < progress.size(); ++i) {
            EXPECT_GE(progress[i].percent, last) << "progress went backwards at event " << i;
            last = progress[i].percent;
            if (progress[i].percent == 100) {
                hundreds++;
                EXPECT_EQ(i, progress.size() - 1) << "100 must be the final progress event";
            } else {
                EXPECT_LE(progress[i].percent, 99);
            }
        }
        EXPECT_EQ(hundreds, expect_complete ? 1 : 0);
    }

    RecordingSink sender_sink_;
    RecordingSink receiver_sink_;
    ThreadManager sender_threads_;
    ThreadManager receiver_threads_;
    std::unique_ptr<FileTransferEngine> sender_;
    std::unique_ptr<FileTransferEngine> receiver_;

    std::mutex captured_mutex_;
    std::vector<Message> captured_;
    std::vector<std::string> created_files_;
};

TEST_F(FileTransferTest, SendEmitsInfoChunksAndEnd) {
    std::string path = create_test_file("three_chunks.bin", 20000);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    ASSERT_EQ(captured_.size(), 5u);
    const auto& info = std::get<FileInfoMessage>(captured_[0]);
    EXPECT_EQ(info.name, "three_chunks.bin");
    EXPECT_EQ(info.size, 20000u);
    EXPECT_EQ(info.digest, md5_file_hex(path));
    EXPECT_EQ(info.transfer_id.size(), 32u);

    EXPECT_EQ(std::get<FileDataMessage>(captured_[1]).chunk.size(), 8192u);
    EXPECT_EQ(std::get<FileDataMessage>(captured_[2]).chunk.size(), 8192u);
    EXPECT_EQ(std::get<FileDataMessage>(captured_[3]).chunk.size(), 20000u - 2 * 8192u);
    for (int i = 1; i <= 3; ++i) {
        EXPECT_EQ(std::get<FileDataMessage>(captured_[i]).transfer_id, info.transfer_id);
    }

    const auto& end = std::get<FileEndMessage>(captured_[4]);
    EXPECT_EQ(end.transfer_id, info.transfer_id);
    EXPECT_EQ(end.digest, info.digest);

    EXPECT_EQ(sender_->get_active_transfer_count(), 0u);
    expect_well_formed_progress(sender_sink_.get_progress(), true);
}

TEST_F(FileTransferTest, ReceivedFileIsByteIdentical) {
    std::string path = create_test_file("identical.bin", 100000);
    ASSERT_TRUE(sender_->send_file(path, capture()));
    deliver_all();

    auto received = receiver_sink_.get_received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].first, "identical.bin");
    EXPECT_EQ(received[0].second, read_all(path));
    EXPECT_TRUE(receiver_sink_.get_failed().empty());
    EXPECT_EQ(receiver_->get_active_transfer_count(), 0u);

    expect_well_formed_progress(receiver_sink_.get_progress(), true);
}

TEST_F(FileTransferTest, FlippedBitFailsVerification) {
    std::string path = create_test_file("corrupt.bin", 30000);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    std::get<FileDataMessage>(captured_[2]).chunk[100] ^= 0x01;
    deliver_all();

    EXPECT_TRUE(receiver_sink_.get_received().empty());
    auto failed = receiver_sink_.get_failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].first, "corrupt.bin");
    EXPECT_EQ(receiver_->get_active_transfer_count(), 0u);

    expect_well_formed_progress(receiver_sink_.get_progress(), false);
}

TEST_F(FileTransferTest, CompleteReceiveThrowsIntegrityError) {
    std::string path = create_test_file("direct.bin", 1000);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    std::get<FileDataMessage>(captured_[1]).chunk[0] ^= 0x80;
    for (size_t i = 0; i + 1 < captured_.size(); ++i) {
        receiver_->handle_message(captured_[i]);
    }

    const auto& end = std::get<FileEndMessage>(captured_.back());
    std::string name;
    try {
        receiver_->complete_receive(end, "", name);
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& e) {
        EXPECT_EQ(e.transfer_id(), end.transfer_id);
        EXPECT_EQ(e.filename(), "direct.bin");
    }
    // The buffer is gone with the failed transfer
    EXPECT_FALSE(receiver_->has_transfer(end.transfer_id));
}

TEST_F(FileTransferTest, MissingChunkIsSizeMismatch) {
    std::string path = create_test_file("short.bin", 20000);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    captured_.erase(captured_.begin() + 2);
    deliver_all();

    EXPECT_TRUE(receiver_sink_.get_received().empty());
    EXPECT_EQ(receiver_sink_.get_failed().size(), 1u);
}

TEST_F(FileTransferTest, EmptyFileTransfers) {
    std::string path = create_test_file("empty.txt", 0);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    ASSERT_EQ(captured_.size(), 2u);
    EXPECT_EQ(std::get<FileInfoMessage>(captured_[0]).size, 0u);
    deliver_all();

    auto received = receiver_sink_.get_received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_TRUE(received[0].second.empty());
    expect_well_formed_progress(receiver_sink_.get_progress(), true);
    expect_well_formed_progress(sender_sink_.get_progress(), true);
}

TEST_F(FileTransferTest, UnknownTransferIdsAreIgnored) {
    FileDataMessage data;
    data.transfer_id = "does-not-exist";
    data.chunk = {1, 2, 3};
    FileEndMessage end;
    end.transfer_id = "does-not-exist";
    end.digest = "00";

    EXPECT_TRUE(receiver_->handle_message(data));
    EXPECT_TRUE(receiver_->handle_message(end));

    EXPECT_TRUE(receiver_sink_.get_progress().empty());
    EXPECT_TRUE(receiver_sink_.get_failed().empty());
    EXPECT_TRUE(receiver_sink_.get_received().empty());
}

TEST_F(FileTransferTest, DuplicateFileInfoIsIgnored) {
    std::string path = create_test_file("dup.bin", 5000);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    // Replay the announcement after the data has started arriving
    captured_.insert(captured_.begin() + 2, captured_[0]);
    deliver_all();

    auto received = receiver_sink_.get_received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].second, read_all(path));
}

TEST_F(FileTransferTest, NonFileMessagesAreNotHandled) {
    EXPECT_FALSE(receiver_->handle_message(make_chat_message("a", "b")));
    EXPECT_FALSE(receiver_->handle_message(make_handshake_message()));
}

TEST_F(FileTransferTest, MissingFileIsReportedAsFailure) {
    EXPECT_FALSE(sender_->send_file("test_transfer_data/nope.bin", capture()));
    EXPECT_TRUE(captured_.empty());

    auto failed = sender_sink_.get_failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].first, "nope.bin");

    EXPECT_FALSE(sender_->start_send("test_transfer_data/nope.bin", capture()));
}

TEST_F(FileTransferTest, SendErrorAbortsTransfer) {
    std::string path = create_test_file("abort.bin", 50000);
    int sent = 0;
    MessageSender flaky = [&sent](const Message&) {
        if (++sent == 3) {
            throw ConnectionError("connection reset");
        }
    };

    EXPECT_FALSE(sender_->send_file(path, flaky));
    EXPECT_EQ(sent, 3);
    EXPECT_EQ(sender_->get_active_transfer_count(), 0u);

    auto failed = sender_sink_.get_failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_THAT(failed[0].second, ::testing::HasSubstr("connection reset"));
    expect_well_formed_progress(sender_sink_.get_progress(), false);
}

TEST_F(FileTransferTest, StartSendRunsOnManagedThread) {
    std::string path = create_test_file("background.bin", 40000);
    ASSERT_TRUE(sender_->start_send(path, capture()));

    ASSERT_TRUE(sender_sink_.wait_for([&]() {
        for (const auto& p : sender_sink_.progress) {
            if (p.percent == 100) return true;
        }
        return false;
    }));
    sender_threads_.join_all_active_threads();

    deliver_all();
    auto received = receiver_sink_.get_received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].second, read_all(path));
}

TEST_F(FileTransferTest, ConcurrentTransfersStayIndependent) {
    std::string first = create_test_file("first.bin", 30000);
    std::string second = create_test_file("second.bin", 12345);

    std::vector<Message> first_messages;
    std::vector<Message> second_messages;
    ASSERT_TRUE(sender_->send_file(first, [&](const Message& m) { first_messages.push_back(m); }));
    ASSERT_TRUE(sender_->send_file(second, [&](const Message& m) { second_messages.push_back(m); }));

    // Interleave the two streams message by message
    for (size_t i = 0; i < std::max(first_messages.size(), second_messages.size()); ++i) {
        if (i < first_messages.size()) receiver_->handle_message(first_messages[i]);
        if (i < second_messages.size()) receiver_->handle_message(second_messages[i]);
    }

    auto received = receiver_sink_.get_received();
    ASSERT_EQ(received.size(), 2u);
    for (const auto& file : received) {
        EXPECT_EQ(file.second, read_all("test_transfer_data/" + file.first));
    }
}

TEST_F(FileTransferTest, AbortTransfersFromSource) {
    std::string path = create_test_file("partial.bin", 20000);
    ASSERT_TRUE(sender_->send_file(path, capture()));

    receiver_->handle_message(captured_[0], "10.0.0.1:4000");
    receiver_->handle_message(captured_[1], "10.0.0.1:4000");
    EXPECT_EQ(receiver_->get_active_transfer_count(), 1u);

    receiver_->abort_transfers_from("10.0.0.2:4000", "other peer left");
    EXPECT_EQ(receiver_->get_active_transfer_count(), 1u);

    receiver_->abort_transfers_from("10.0.0.1:4000", "sender left");
    EXPECT_EQ(receiver_->get_active_transfer_count(), 0u);

    auto failed = receiver_sink_.get_failed();
    ASSERT_EQ(failed.size(), 1u);
    EXPECT_EQ(failed[0].second, "sender left");

    // The rest of the stream no longer matches anything
    for (size_t i = 2; i < captured_.size(); ++i) {
        receiver_->handle_message(captured_[i], "10.0.0.1:4000");
    }
    EXPECT_TRUE(receiver_sink_.get_received().empty());
}

TEST_F(FileTransferTest, DataFromAnotherPeerIsIgnored) {
    std::string path = create_test_file("owned.bin", 20000);
    ASSERT_TRUE(sender_->send_file(path, capture()));
    ASSERT_EQ(captured_.size(), 5u);
    const std::string transfer_id = std::get<FileInfoMessage>(captured_[0]).transfer_id;

    receiver_->handle_message(captured_[0], "10.0.0.1:4000");

    // Another peer reusing the id can neither add bytes nor finish the transfer
    FileDataMessage forged;
    forged.transfer_id = transfer_id;
    forged.chunk = std::vector<uint8_t>(100, 0xEE);
    receiver_->handle_message(Message(forged), "10.0.0.2:4000");
    receiver_->handle_message(captured_[4], "10.0.0.2:4000");
    EXPECT_TRUE(receiver_->has_transfer(transfer_id));
    EXPECT_TRUE(receiver_sink_.get_failed().empty());

    std::string name;
    EXPECT_THROW(receiver_->complete_receive(std::get<FileEndMessage>(captured_[4]), "10.0.0.2:4000", name),
                 std::out_of_range);
    EXPECT_TRUE(receiver_->has_transfer(transfer_id));

    for (size_t i = 1; i < captured_.size(); ++i) {
        receiver_->handle_message(captured_[i], "10.0.0.1:4000");
    }

    auto received = receiver_sink_.get_received();
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].first, "owned.bin");
    EXPECT_EQ(received[0].second, read_all(path));
    EXPECT_TRUE(receiver_sink_.get_failed().empty());
    EXPECT_FALSE(receiver_->has_transfer(transfer_id));
}

TEST_F(FileTransferTest, TransferIdsAreRandomHex) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        std::string id = FileTransferEngine::generate_transfer_id();
        EXPECT_TRUE(std::regex_match(id, std::regex("[0-9a-f]{32}"))) << id;
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

TEST_F(FileTransferTest, CustomChunkSize) {
    FileTransferEngine small_chunks(sender_sink_, sender_threads_, 1000);
    std::string path = create_test_file("small_chunks.bin", 4500);
    ASSERT_TRUE(small_chunks.send_file(path, capture()));

    // info + 5 chunks + end
    EXPECT_EQ(captured_.size(), 7u);
}
