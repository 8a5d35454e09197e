#pragma once

#include <stdexcept>
#include <string>

namespace lanmeet {

/**
 * Base of every error the session layer raises.
 */
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * A read or write failed on a socket that was otherwise open
 * (reset, broken pipe, receive timeout).
 */
class ConnectionError : public SessionError {
public:
    explicit ConnectionError(const std::string& message) : SessionError(message) {}
};

/**
 * The peer closed the connection: a zero-length read, either before a frame
 * started or in the middle of one.
 */
class ConnectionClosed : public SessionError {
public:
    explicit ConnectionClosed(const std::string& message) : SessionError(message) {}
};

/**
 * Malformed frame length, undecodable payload, unknown message tag, or a
 * required field that is missing or has the wrong type.
 *
 * stream_intact() is true when the full advertised frame was consumed, so the
 * next frame boundary is still known and the connection can keep going.
 */
class ProtocolError : public SessionError {
public:
    explicit ProtocolError(const std::string& message, bool stream_intact = true)
        : SessionError(message), stream_intact_(stream_intact) {}

    bool stream_intact() const { return stream_intact_; }

private:
    bool stream_intact_;
};

/**
 * A received file's digest (or size) did not match what the sender advertised.
 */
class IntegrityError : public SessionError {
public:
    IntegrityError(const std::string& message, const std::string& transfer_id, const std::string& filename)
        : SessionError(message), transfer_id_(transfer_id), filename_(filename) {}

    const std::string& transfer_id() const { return transfer_id_; }
    const std::string& filename() const { return filename_; }

private:
    std::string transfer_id_;
    std::string filename_;
};

/**
 * Joining a session failed on every attempt of the retry budget.
 */
class ConnectFailed : public SessionError {
public:
    ConnectFailed(const std::string& message, int attempts)
        : SessionError(message), attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

} // namespace lanmeet
