#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace lanmeet {

constexpr int DEFAULT_PORT = 9999;

/**
 * Session settings. Every field has a working default, so a missing or
 * partial config file is fine.
 */
struct SessionConfig {
    std::string bind_address;                   // Host: interface to listen on
    int port;                                   // Host: listen port (0 picks an ephemeral port)
    std::string display_name;                   // Sender name on outgoing chat; empty means "host" / "client"
    int retry_count;                            // Client: connect attempts before giving up
    std::chrono::milliseconds retry_delay;      // Client: pause between attempts
    std::chrono::milliseconds connect_timeout;  // Client: connect and handshake window per attempt
    size_t chunk_size;                          // Bytes per file_data message
    int listen_backlog;

    SessionConfig()
        : bind_address("0.0.0.0"),
          port(DEFAULT_PORT),
          retry_count(3),
          retry_delay(1000),
          connect_timeout(5000),
          chunk_size(8192),
          listen_backlog(5) {}
};

/**
 * Read settings from a JSON file. Keys that are absent keep the value already
 * in `config`.
 * @return false if the file cannot be read or parsed (config is left untouched)
 */
bool load_session_config(const std::string& path, SessionConfig& config);

/**
 * Write settings as pretty-printed JSON
 * @return true on success
 */
bool save_session_config(const std::string& path, const SessionConfig& config);

} // namespace lanmeet
