#ifndef CLIENT_CONFIG_HPP
#define CLIENT_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <string>

#include "Protocol.hpp"


// Runtime settings for one transfer session
struct ClientConfig {
    std::string server_host;
    int control_port = 0;
    Protocol::TransferRequest request = Protocol::TransferRequest::list(0);

    // Pauses that give a slow server time to reach accept()/send()
    std::chrono::milliseconds send_delay{1000};
    std::chrono::milliseconds accept_delay{1000};

    std::string log_file = "logs/ftclient.log";  // Empty disables the log file
    std::filesystem::path download_dir = ".";
};

#endif // CLIENT_CONFIG_HPP
