#include "config.h"
#include "errors.h"
#include "event_sink.h"
#include "fs.h"
#include "logger.h"
#include "network_utils.h"
#include "session.h"
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

namespace {

const char* const DOWNLOAD_DIRECTORY = "downloads";

std::mutex console_mutex;

void print_prompt() {
    std::cout << "> ";
    std::flush(std::cout);
}

/**
 * Prints session events to the console and saves verified files under ./downloads/
 */
class ConsoleEventSink : public lanmeet::EventSink {
public:
    void on_chat(const std::string& sender, const std::string& text) override {
        std::lock_guard<std::mutex> lock(console_mutex);
        std::cout << "\r[" << lanmeet::format_current_time("%H:%M:%S") << "] " << sender << ": " << text << "\n";
        print_prompt();
    }

    void on_connection_state(lanmeet::ConnectionState state) override {
        LOG_MAIN_INFO("Connection state: " << lanmeet::connection_state_name(state));
    }

    void on_file_progress(const std::string& name, int percent) override {
        if (percent == 0 || percent == 100 || percent % 25 == 0) {
            LOG_MAIN_DEBUG("File " << name << ": " << percent << "%");
        }
    }

    void on_connection_error(const std::string& message) override {
        LOG_MAIN_ERROR(message);
    }

    void on_video_frame(const std::vector<uint8_t>& frame) override {
        LOG_MAIN_DEBUG("Video frame of " << frame.size() << " bytes");
    }

    void on_peer_joined(const std::string& address) override {
        LOG_MAIN_INFO("Peer joined: " << address);
    }

    void on_peer_left(const std::string& address, bool lost) override {
        LOG_MAIN_INFO("Peer " << (lost ? "lost: " : "left: ") << address);
    }

    void on_file_received(const std::string& name, std::vector<uint8_t>&& data) override {
        if (!lanmeet::create_directories(DOWNLOAD_DIRECTORY)) {
            LOG_MAIN_ERROR("Cannot create " << DOWNLOAD_DIRECTORY << ", dropping " << name);
            return;
        }
        std::string path = lanmeet::combine_paths(DOWNLOAD_DIRECTORY, name);
        if (lanmeet::create_file_binary(path, data.data(), data.size())) {
            LOG_MAIN_INFO("Saved " << name << " (" << data.size() << " bytes) to " << path);
        }
    }

    void on_file_failed(const std::string& name, const std::string& reason) override {
        LOG_MAIN_WARN("Transfer of " << name << " failed: " << reason);
    }
};

void print_usage(const char* program_name) {
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " host [port] [--config <file>]\n";
    std::cout << "  " << program_name << " join <host>[:port] [port] [--config <file>]\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --config <file>   Load session settings from a JSON file\n";
    std::cout << "  --name <name>     Name shown next to your chat messages\n";
    std::cout << "  --log <file>      Also append log output to a file\n";
    std::cout << "  --debug           Enable debug logging\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " host 9999\n";
    std::cout << "  " << program_name << " join 192.168.1.20 9999 --name alice\n";
    std::cout << "  " << program_name << " join 192.168.1.20:9999\n";
}

void print_help() {
    std::cout << "\nAvailable commands:\n";
    std::cout << "  say <text>    - Send a chat message (plain text works too)\n";
    std::cout << "  send <path>   - Send a file to the session\n";
    std::cout << "  peers         - Show connected peers\n";
    std::cout << "  help          - Show this help message\n";
    std::cout << "  quit          - Leave the session and exit\n";
}

bool parse_port(const std::string& text, int& port) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || value < 0 || value > 65535) {
            return false;
        }
        port = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string mode = argv[1];
    if (mode != "host" && mode != "join") {
        print_usage(argv[0]);
        return 1;
    }

    lanmeet::SessionConfig config;
    std::string join_host;
    std::string display_name;
    bool port_given = false;
    int port = lanmeet::DEFAULT_PORT;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            if (!lanmeet::load_session_config(argv[++i], config)) {
                return 1;
            }
        } else if (arg == "--name" && i + 1 < argc) {
            display_name = argv[++i];
        } else if (arg == "--log" && i + 1 < argc) {
            lanmeet::Logger::getInstance().set_log_file_path(argv[++i]);
            lanmeet::Logger::getInstance().set_file_logging_enabled(true);
        } else if (arg == "--debug") {
            lanmeet::Logger::getInstance().set_log_level(lanmeet::LogLevel::DEBUG);
        } else if (mode == "join" && join_host.empty()) {
            std::string host_part;
            int port_part = 0;
            if (!port_given && lanmeet::network_utils::parse_address_string(arg, host_part, port_part)) {
                join_host = host_part;
                port = port_part;
                port_given = true;
            } else {
                join_host = arg;
            }
        } else if (!port_given && parse_port(arg, port)) {
            port_given = true;
        } else {
            std::cerr << "Unexpected argument: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    // A port on the command line wins over the config file
    if (port_given) {
        config.port = port;
    }
    if (!display_name.empty()) {
        config.display_name = display_name;
    }
    if (mode == "join" && join_host.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    ConsoleEventSink sink;
    lanmeet::SessionManager session(sink, config);

    if (mode == "host") {
        if (!session.create_session()) {
            LOG_MAIN_ERROR("Could not create a session on port " << config.port);
            return 1;
        }
        LOG_MAIN_INFO("Hosting on " << lanmeet::network_utils::get_local_ip() << ":" << session.get_listen_port()
                      << ". Clients can join with: join <address> " << session.get_listen_port());
    } else {
        if (!lanmeet::network_utils::is_valid_ipv4(join_host) &&
            lanmeet::network_utils::resolve_hostname(join_host).empty()) {
            LOG_MAIN_ERROR("Cannot resolve " << join_host);
            return 1;
        }
        try {
            session.join_session(join_host, config.port);
        } catch (const lanmeet::ConnectFailed& e) {
            LOG_MAIN_ERROR(e.what());
            return 1;
        }
    }

    print_help();
    print_prompt();

    std::string input;
    while (std::getline(std::cin, input)) {
        if (input.empty()) {
            print_prompt();
            continue;
        }

        std::istringstream iss(input);
        std::string command;
        iss >> command;

        std::string rest;
        std::getline(iss, rest);
        size_t start = rest.find_first_not_of(' ');
        rest = start == std::string::npos ? "" : rest.substr(start);

        if (command == "quit" || command == "exit") {
            break;
        } else if (command == "help") {
            print_help();
        } else if (command == "peers") {
            auto peers = session.get_peer_addresses();
            std::lock_guard<std::mutex> lock(console_mutex);
            std::cout << peers.size() << " connected peer(s)\n";
            for (const auto& address : peers) {
                std::cout << "  " << address << "\n";
            }
        } else if (command == "send") {
            if (rest.empty()) {
                std::cout << "Usage: send <path>\n";
            } else if (session.send_file(rest)) {
                LOG_MAIN_INFO("Sending " << lanmeet::get_filename_from_path(rest));
            }
        } else if (command == "say") {
            session.send_chat(rest);
        } else {
            session.send_chat(input);
        }

        if (session.get_role() == lanmeet::SessionRole::CLIENT &&
            session.get_client_state() == lanmeet::ClientState::DISCONNECTED) {
            LOG_MAIN_INFO("Session ended");
            break;
        }
        print_prompt();
    }

    LOG_MAIN_INFO("Leaving session");
    session.stop();
    return 0;
}
