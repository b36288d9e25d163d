/**
 * @file server_example.cpp
 * @brief Serve a directory read-only until SIGINT or SIGTERM
 *
 * Usage: stftp_server_example <root_dir> [port] [log_level]
 */

#include "stftp/stftp_server.h"
#include "stftp/stftp_logger.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_running(true);

void HandleSignal(int) {
    g_running = false;
}

bool ParsePort(const char* text, uint16_t& port) {
    unsigned long value = 0;
    try {
        value = std::stoul(text);
    } catch (const std::logic_error&) {
        return false;
    }
    if (value == 0 || value > std::numeric_limits<uint16_t>::max()) {
        return false;
    }
    port = static_cast<uint16_t>(value);
    return true;
}

void ReportTransfer(const std::string& filename, const stftp::net::SocketAddress& client,
                    const stftp::TransferResult& result) {
    if (result.Ok()) {
        std::cout << client.ToString() << " <- " << filename << " ("
                  << result.bytes_sent << " bytes)" << std::endl;
    } else {
        std::cout << client.ToString() << " <- " << filename << " failed: "
                  << stftp::TransferStatusToString(result.status) << ": "
                  << result.message << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <root_dir> [port] [log_level]" << std::endl;
        return 1;
    }

    std::string root_dir = argv[1];
    uint16_t port = stftp::kDefaultTftpPort;
    if (argc > 2 && !ParsePort(argv[2], port)) {
        std::cerr << "Invalid port number: " << argv[2] << std::endl;
        return 1;
    }

    int log_level = stftp::kLogInfo;
    if (argc > 3 && !stftp::ParseLogLevel(argv[3], log_level)) {
        std::cerr << "Unknown log level: " << argv[3]
                  << " (trace, debug, info, warn, error, critical)" << std::endl;
        return 1;
    }
    stftp::Logger::GetInstance().SetLogLevel(log_level);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    try {
        stftp::TftpServer server(root_dir, port);
        server.SetTimeout(5);
        server.SetTransferCallback(ReportTransfer);

        if (!server.Start()) {
            std::cerr << "Failed to start the server on port " << port << std::endl;
            return 1;
        }
        std::cout << "Serving " << root_dir << " on port " << port
                  << " (log level " << stftp::LogLevelName(log_level) << "), Ctrl+C to stop"
                  << std::endl;

        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        server.Stop();
    } catch (const stftp::StftpException& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
