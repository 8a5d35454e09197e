#include "config.h"
#include "fs.h"
#include "logger.h"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace lanmeet {

bool load_session_config(const std::string& path, SessionConfig& config) {
    LOG_CONFIG_INFO("Loading configuration from " << path);

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_CONFIG_ERROR("Cannot open configuration file: " << path);
        return false;
    }
    std::stringstream contents;
    contents << file.rdbuf();

    try {
        nlohmann::json json = nlohmann::json::parse(contents.str());
        if (!json.is_object()) {
            LOG_CONFIG_ERROR("Configuration file is not a JSON object: " << path);
            return false;
        }

        SessionConfig loaded = config;
        loaded.bind_address = json.value("bind_address", loaded.bind_address);
        loaded.port = json.value("port", loaded.port);
        loaded.display_name = json.value("display_name", loaded.display_name);
        loaded.retry_count = json.value("retry_count", loaded.retry_count);
        loaded.retry_delay = std::chrono::milliseconds(
            json.value("retry_delay_ms", static_cast<int64_t>(loaded.retry_delay.count())));
        loaded.connect_timeout = std::chrono::milliseconds(
            json.value("connect_timeout_ms", static_cast<int64_t>(loaded.connect_timeout.count())));
        loaded.chunk_size = json.value("chunk_size", loaded.chunk_size);
        loaded.listen_backlog = json.value("listen_backlog", loaded.listen_backlog);

        if (loaded.port < 0 || loaded.port > 65535) {
            LOG_CONFIG_ERROR("Invalid port in configuration: " << loaded.port);
            return false;
        }
        if (loaded.retry_count < 1) {
            LOG_CONFIG_WARN("retry_count " << loaded.retry_count << " raised to 1");
            loaded.retry_count = 1;
        }
        if (loaded.chunk_size == 0) {
            LOG_CONFIG_WARN("chunk_size 0 replaced with default");
            loaded.chunk_size = SessionConfig().chunk_size;
        }

        config = loaded;
        LOG_CONFIG_DEBUG("Configuration loaded: bind " << config.bind_address << ":" << config.port);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file: " << e.what());
        return false;
    }
}

bool save_session_config(const std::string& path, const SessionConfig& config) {
    LOG_CONFIG_DEBUG("Saving configuration to " << path);

    nlohmann::json json;
    json["bind_address"] = config.bind_address;
    json["port"] = config.port;
    json["display_name"] = config.display_name;
    json["retry_count"] = config.retry_count;
    json["retry_delay_ms"] = static_cast<int64_t>(config.retry_delay.count());
    json["connect_timeout_ms"] = static_cast<int64_t>(config.connect_timeout.count());
    json["chunk_size"] = config.chunk_size;
    json["listen_backlog"] = config.listen_backlog;

    std::string data = json.dump(4);
    if (!create_file_binary(path, data.data(), data.size())) {
        LOG_CONFIG_ERROR("Failed to write configuration file: " << path);
        return false;
    }
    return true;
}

} // namespace lanmeet
