#include "file_transfer.h"
#include "digest.h"
#include "errors.h"
#include "fs.h"
#include "logger.h"
#include <algorithm>
#include <fstream>
#include <random>
#include <sstream>
#include <stdexcept>

// File transfer module logging macros
#define LOG_FILE_TRANSFER_DEBUG(message) LOG_DEBUG("filetransfer", message)
#define LOG_FILE_TRANSFER_INFO(message)  LOG_INFO("filetransfer", message)
#define LOG_FILE_TRANSFER_WARN(message)  LOG_WARN("filetransfer", message)
#define LOG_FILE_TRANSFER_ERROR(message) LOG_ERROR("filetransfer", message)

namespace lanmeet {

namespace {

// Upper bound for the up-front reservation of a receive buffer; the announced
// size comes from the peer and is not trusted for allocation.
constexpr uint64_t MAX_RESERVE_BYTES = 64ull * 1024ull * 1024ull;

} // namespace

const char* transfer_status_name(TransferStatus status) {
    switch (status) {
        case TransferStatus::PREPARING: return "preparing";
        case TransferStatus::ACTIVE:    return "active";
        case TransferStatus::COMPLETE:  return "complete";
        case TransferStatus::FAILED:    return "failed";
    }
    return "unknown";
}

FileTransferEngine::FileTransferEngine(EventSink& sink, ThreadManager& threads, size_t chunk_size)
    : sink_(sink), threads_(threads), chunk_size_(chunk_size > 0 ? chunk_size : DEFAULT_CHUNK_SIZE) {
    LOG_FILE_TRANSFER_DEBUG("FileTransferEngine created with chunk size " << chunk_size_);
}

FileTransferEngine::~FileTransferEngine() {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    if (!transfers_.empty()) {
        LOG_FILE_TRANSFER_INFO("Discarding " << transfers_.size() << " unfinished transfers");
    }
    transfers_.clear();
}

//=============================================================================
// Sending
//=============================================================================

bool FileTransferEngine::send_file(const std::string& path, const MessageSender& sender) {
    const std::string name = get_filename_from_path(path);

    int64_t file_size = get_file_size(path);
    if (file_size < 0 || !file_exists(path)) {
        LOG_FILE_TRANSFER_ERROR("File does not exist: " << path);
        sink_.on_file_failed(name, "Cannot read " + path);
        return false;
    }

    const std::string digest = md5_file_hex(path);
    std::ifstream file(path, std::ios::binary);
    if (digest.empty() || !file.is_open()) {
        LOG_FILE_TRANSFER_ERROR("Failed to open file for sending: " << path);
        sink_.on_file_failed(name, "Cannot read " + path);
        return false;
    }

    auto session = register_send(name, static_cast<uint64_t>(file_size), digest);
    LOG_FILE_TRANSFER_INFO("Sending " << name << " (" << session->size << " bytes) as transfer " << session->transfer_id);

    std::string failure;
    try {
        FileInfoMessage info;
        info.transfer_id = session->transfer_id;
        info.name = name;
        info.size = session->size;
        info.digest = digest;
        sender(info);
        session->status = TransferStatus::ACTIVE;

        std::vector<char> buffer(chunk_size_);
        while (session->bytes_moved < session->size) {
            if (threads_.is_shutdown_requested()) {
                failure = "Session is shutting down";
                break;
            }

            size_t to_read = static_cast<size_t>(
                std::min<uint64_t>(chunk_size_, session->size - session->bytes_moved));
            file.read(buffer.data(), static_cast<std::streamsize>(to_read));
            if (static_cast<size_t>(file.gcount()) != to_read) {
                failure = "Read error after " + std::to_string(session->bytes_moved) + " bytes";
                break;
            }

            FileDataMessage data;
            data.transfer_id = session->transfer_id;
            data.chunk.assign(buffer.begin(), buffer.begin() + to_read);
            sender(data);

            session->bytes_moved += to_read;
            sink_.on_file_progress(name, progress_percent(session->bytes_moved, session->size));
        }

        if (failure.empty()) {
            FileEndMessage end;
            end.transfer_id = session->transfer_id;
            end.digest = digest;
            sender(end);
        }
    } catch (const SessionError& e) {
        failure = e.what();
    }

    if (!failure.empty()) {
        LOG_FILE_TRANSFER_ERROR("Transfer " << session->transfer_id << " of " << name << " failed: " << failure);
        finish_transfer(session->transfer_id, TransferStatus::FAILED);
        sink_.on_file_failed(name, failure);
        return false;
    }

    finish_transfer(session->transfer_id, TransferStatus::COMPLETE);
    LOG_FILE_TRANSFER_INFO("Finished sending " << name);
    sink_.on_file_progress(name, 100);
    return true;
}

bool FileTransferEngine::start_send(const std::string& path, MessageSender sender) {
    if (!file_exists(path) || get_file_size(path) < 0) {
        LOG_FILE_TRANSFER_ERROR("File does not exist: " << path);
        sink_.on_file_failed(get_filename_from_path(path), "Cannot read " + path);
        return false;
    }

    return threads_.add_managed_thread([this, path, sender]() {
        send_file(path, sender);
    }, "file-send: " + get_filename_from_path(path));
}

std::shared_ptr<TransferSession> FileTransferEngine::register_send(const std::string& name, uint64_t size,
                                                                   const std::string& digest) {
    auto session = std::make_shared<TransferSession>();
    session->name = name;
    session->size = size;
    session->digest = digest;
    session->direction = TransferDirection::SEND;
    session->status = TransferStatus::PREPARING;

    std::lock_guard<std::mutex> lock(transfers_mutex_);
    do {
        session->transfer_id = generate_transfer_id();
    } while (transfers_.find(session->transfer_id) != transfers_.end());
    transfers_[session->transfer_id] = session;
    return session;
}

void FileTransferEngine::finish_transfer(const std::string& transfer_id, TransferStatus status) {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return;
    }
    it->second->status = status;
    LOG_FILE_TRANSFER_DEBUG("Transfer " << transfer_id << " is " << transfer_status_name(status));
    transfers_.erase(it);
}

//=============================================================================
// Receiving
//=============================================================================

void FileTransferEngine::handle_file_info(const FileInfoMessage& info, const std::string& source) {
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        if (transfers_.find(info.transfer_id) != transfers_.end()) {
            LOG_FILE_TRANSFER_WARN("Ignoring duplicate file_info for live transfer " << info.transfer_id);
            return;
        }

        auto session = std::make_shared<TransferSession>();
        session->transfer_id = info.transfer_id;
        session->name = get_filename_from_path(info.name);
        session->size = info.size;
        session->digest = info.digest;
        session->direction = TransferDirection::RECEIVE;
        session->status = TransferStatus::ACTIVE;
        session->source = source;
        session->buffer.reserve(static_cast<size_t>(std::min(info.size, MAX_RESERVE_BYTES)));
        transfers_[info.transfer_id] = session;
    }

    LOG_FILE_TRANSFER_INFO("Receiving " << info.name << " (" << info.size << " bytes) as transfer " << info.transfer_id);
    sink_.on_file_progress(get_filename_from_path(info.name), 0);
}

void FileTransferEngine::handle_file_data(const FileDataMessage& data, const std::string& source) {
    std::string name;
    int percent = 0;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(data.transfer_id);
        if (it == transfers_.end() || it->second->direction != TransferDirection::RECEIVE) {
            LOG_FILE_TRANSFER_DEBUG("Ignoring file_data for unknown transfer " << data.transfer_id);
            return;
        }
        if (it->second->source != source) {
            LOG_FILE_TRANSFER_WARN("Ignoring file_data for transfer " << data.transfer_id << " from " << source
                                   << ", it arrives from " << it->second->source);
            return;
        }

        TransferSession& session = *it->second;
        session.buffer.insert(session.buffer.end(), data.chunk.begin(), data.chunk.end());
        session.bytes_moved = session.buffer.size();
        name = session.name;
        percent = progress_percent(session.bytes_moved, session.size);
    }
    sink_.on_file_progress(name, percent);
}

std::vector<uint8_t> FileTransferEngine::complete_receive(const FileEndMessage& end, const std::string& source,
                                                          std::string& name_out) {
    std::shared_ptr<TransferSession> session;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        auto it = transfers_.find(end.transfer_id);
        if (it == transfers_.end() || it->second->direction != TransferDirection::RECEIVE) {
            throw std::out_of_range("No active receive with id " + end.transfer_id);
        }
        if (it->second->source != source) {
            throw std::out_of_range("Transfer " + end.transfer_id + " does not arrive from " + source);
        }
        session = it->second;
        transfers_.erase(it);
    }
    name_out = session->name;

    if (session->buffer.size() != session->size) {
        session->status = TransferStatus::FAILED;
        throw IntegrityError("Received " + std::to_string(session->buffer.size()) + " bytes of " +
                             std::to_string(session->size) + " announced",
                             session->transfer_id, session->name);
    }

    const std::string actual = md5_hex(session->buffer);
    if (actual != session->digest || (!end.digest.empty() && end.digest != session->digest)) {
        session->status = TransferStatus::FAILED;
        throw IntegrityError("Digest mismatch: expected " + session->digest + ", got " + actual,
                             session->transfer_id, session->name);
    }

    session->status = TransferStatus::COMPLETE;
    return std::move(session->buffer);
}

void FileTransferEngine::handle_file_end(const FileEndMessage& end, const std::string& source) {
    std::string name;
    std::vector<uint8_t> contents;
    try {
        contents = complete_receive(end, source, name);
    } catch (const IntegrityError& e) {
        LOG_FILE_TRANSFER_ERROR("Transfer " << e.transfer_id() << " of " << e.filename()
                                << " failed verification: " << e.what());
        sink_.on_file_failed(e.filename(), e.what());
        return;
    } catch (const std::out_of_range& e) {
        LOG_FILE_TRANSFER_DEBUG("Ignoring file_end: " << e.what());
        return;
    }

    LOG_FILE_TRANSFER_INFO("Received and verified " << name << " (" << contents.size() << " bytes)");
    sink_.on_file_progress(name, 100);
    sink_.on_file_received(name, std::move(contents));
}

bool FileTransferEngine::handle_message(const Message& message, const std::string& source) {
    if (const auto* info = std::get_if<FileInfoMessage>(&message)) {
        handle_file_info(*info, source);
        return true;
    }
    if (const auto* data = std::get_if<FileDataMessage>(&message)) {
        handle_file_data(*data, source);
        return true;
    }
    if (const auto* end = std::get_if<FileEndMessage>(&message)) {
        handle_file_end(*end, source);
        return true;
    }
    return false;
}

void FileTransferEngine::abort_transfers_from(const std::string& source, const std::string& reason) {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            const TransferSession& session = *it->second;
            if (session.direction == TransferDirection::RECEIVE && session.source == source) {
                names.push_back(session.name);
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& name : names) {
        LOG_FILE_TRANSFER_WARN("Aborting incoming " << name << ": " << reason);
        sink_.on_file_failed(name, reason);
    }
}

void FileTransferEngine::abort_all_receives(const std::string& reason) {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(transfers_mutex_);
        for (auto it = transfers_.begin(); it != transfers_.end();) {
            if (it->second->direction == TransferDirection::RECEIVE) {
                names.push_back(it->second->name);
                it = transfers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (const auto& name : names) {
        LOG_FILE_TRANSFER_WARN("Aborting incoming " << name << ": " << reason);
        sink_.on_file_failed(name, reason);
    }
}

size_t FileTransferEngine::get_active_transfer_count() const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    return transfers_.size();
}

bool FileTransferEngine::has_transfer(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(transfers_mutex_);
    return transfers_.find(transfer_id) != transfers_.end();
}

int FileTransferEngine::progress_percent(uint64_t moved, uint64_t total) {
    if (total == 0) {
        return 99;
    }
    uint64_t percent = moved * 100 / total;
    return static_cast<int>(std::min<uint64_t>(percent, 99));
}

std::string FileTransferEngine::generate_transfer_id() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 32; ++i) {
        ss << dis(gen);
    }
    return ss.str();
}

} // namespace lanmeet
