#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lanmeet {

enum class ConnectionState {
    CONNECTING,
    CONNECTED,
    DISCONNECTED
};

const char* connection_state_name(ConnectionState state);

/**
 * Everything the session core reports to the surrounding application.
 *
 * Callbacks run on whichever thread observed the event (accept loop, a
 * connection's receive loop, or a file sender). Implementations that drive a
 * UI must marshal to their UI thread themselves. The core never holds any
 * other reference into the application.
 */
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_chat(const std::string& sender, const std::string& text) = 0;
    virtual void on_connection_state(ConnectionState state) = 0;

    /**
     * @param name File name as announced by the sender
     * @param percent 0..100, non-decreasing per transfer; 100 only once the
     *        transfer has fully completed (and, when receiving, verified)
     */
    virtual void on_file_progress(const std::string& name, int percent) = 0;

    virtual void on_connection_error(const std::string& message) = 0;
    virtual void on_video_frame(const std::vector<uint8_t>& frame) = 0;

    // A client finished the handshake (host side)
    virtual void on_peer_joined(const std::string& address) { (void)address; }

    /**
     * A client went away (host side)
     * @param lost true when the connection broke during a send rather than
     *        being closed by the peer
     */
    virtual void on_peer_left(const std::string& address, bool lost) { (void)address; (void)lost; }

    /**
     * A received file passed verification and can be offered for saving.
     * The buffer is handed over; the core keeps no copy.
     */
    virtual void on_file_received(const std::string& name, std::vector<uint8_t>&& data) {
        (void)name;
        (void)data;
    }

    // A send or receive was aborted; no data is offered for saving
    virtual void on_file_failed(const std::string& name, const std::string& reason) {
        (void)name;
        (void)reason;
    }
};

} // namespace lanmeet
