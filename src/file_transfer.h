#pragma once

#include "event_sink.h"
#include "message.h"
#include "threadmanager.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanmeet {

/**
 * File transfer status codes
 */
enum class TransferStatus {
    PREPARING,  // Sender is sizing and hashing the file
    ACTIVE,     // Chunks are flowing
    COMPLETE,   // Sent, or received and verified
    FAILED      // Aborted or failed verification
};

enum class TransferDirection {
    SEND,
    RECEIVE
};

const char* transfer_status_name(TransferStatus status);

/**
 * One in-flight transfer. Lives in the engine's map from the moment file_info
 * is emitted or received until the transfer completes or fails.
 */
struct TransferSession {
    std::string transfer_id;
    std::string name;
    uint64_t size;
    std::string digest;             // Hex MD5 announced in file_info
    TransferDirection direction;
    TransferStatus status;
    uint64_t bytes_moved;
    std::string source;             // Peer address the transfer arrives from (receive only)
    std::vector<uint8_t> buffer;    // Accumulated chunks (receive only)

    TransferSession() : size(0), direction(TransferDirection::SEND),
                        status(TransferStatus::PREPARING), bytes_moved(0) {}
};

/**
 * Writes one message toward the file's destination.
 * Throws ConnectionError when the write fails.
 */
using MessageSender = std::function<void(const Message&)>;

/**
 * Chunked file transfer on top of the message framer.
 *
 * Sending streams file_info, a run of file_data chunks and file_end through a
 * MessageSender. Receiving accumulates chunks per transfer id in memory and
 * checks the digest when file_end arrives; a verified file is handed to
 * EventSink::on_file_received(). Receive buffers are not bounded, so the
 * largest file a peer can deliver is limited by available memory.
 *
 * Progress for a transfer never decreases, stays at 99 or below until the
 * transfer has completed (and, when receiving, verified) and reports 100
 * exactly once.
 */
class FileTransferEngine {
public:
    static constexpr size_t DEFAULT_CHUNK_SIZE = 8192;

    FileTransferEngine(EventSink& sink, ThreadManager& threads, size_t chunk_size = DEFAULT_CHUNK_SIZE);
    ~FileTransferEngine();

    FileTransferEngine(const FileTransferEngine&) = delete;
    FileTransferEngine& operator=(const FileTransferEngine&) = delete;

    /**
     * Send a file on the calling thread
     * @return true if every message was written, false if the transfer failed
     *         (reported through on_file_failed)
     */
    bool send_file(const std::string& path, const MessageSender& sender);

    /**
     * Send a file on its own managed thread
     * @return false if the file cannot be read; the send itself is not awaited
     */
    bool start_send(const std::string& path, MessageSender sender);

    // Receive side. Unknown transfer ids, and data or end messages from a
    // peer other than the one that announced the transfer, are ignored.
    void handle_file_info(const FileInfoMessage& info, const std::string& source = "");
    void handle_file_data(const FileDataMessage& data, const std::string& source = "");
    void handle_file_end(const FileEndMessage& end, const std::string& source = "");

    /**
     * Finish a receive: remove the transfer and check its size and digest.
     * @return The verified file contents
     * @throws IntegrityError on a mismatch; the buffer is discarded
     * @throws std::out_of_range if the id is not an active receive from `source`;
     *         the transfer is left untouched
     */
    std::vector<uint8_t> complete_receive(const FileEndMessage& end, const std::string& source,
                                          std::string& name_out);

    /**
     * Route a file_info / file_data / file_end message
     * @return true if the message was a file message
     */
    bool handle_message(const Message& message, const std::string& source = "");

    /**
     * Fail every incoming transfer that arrives from `source`
     * (its connection went away). Reports on_file_failed for each.
     */
    void abort_transfers_from(const std::string& source, const std::string& reason);

    // Fail every incoming transfer and discard its buffer
    void abort_all_receives(const std::string& reason);

    size_t get_active_transfer_count() const;
    bool has_transfer(const std::string& transfer_id) const;

    size_t get_chunk_size() const { return chunk_size_; }

    static std::string generate_transfer_id();

private:
    EventSink& sink_;
    ThreadManager& threads_;
    size_t chunk_size_;

    std::unordered_map<std::string, std::shared_ptr<TransferSession>> transfers_;
    mutable std::mutex transfers_mutex_;

    static int progress_percent(uint64_t moved, uint64_t total);

    std::shared_ptr<TransferSession> register_send(const std::string& name, uint64_t size, const std::string& digest);
    void finish_transfer(const std::string& transfer_id, TransferStatus status);
};

} // namespace lanmeet
