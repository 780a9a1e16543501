#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "CommandLine.hpp"
#include "ControlMessageCodec.hpp"

using Protocol::TransferRequest;


bool CommandLine::parse(int argc, const char* const argv[], ClientConfig& config, std::string& error) {
    // host, control port, command, [filename], data port
    if (argc < 5 || argc > 6) {
        error = "Wrong number of arguments";
        return false;
    }

    std::string command = argv[3];
    if (command == "-g" && argc < 6) {
        error = "Missing file name for -g";
        return false;
    }

    config.server_host = argv[1];
    if (!parsePort(argv[2], config.control_port)) {
        error = std::string("Invalid control port: ") + argv[2];
        return false;
    }

    // The data port is always the last argument
    int data_port = 0;
    if (!parsePort(argv[argc - 1], data_port)) {
        error = std::string("Invalid data port: ") + argv[argc - 1];
        return false;
    }

    if (command == "-l") {
        config.request = TransferRequest::list(data_port);
    }
    else if (command == "-g") {
        std::string filename = argv[4];
        if (filename.empty()) {
            error = "Missing file name for -g";
            return false;
        }
        if (filename.size() > ControlMessageCodec::maxFilenameLength(data_port)) {
            error = "File name too long (max "
                  + std::to_string(ControlMessageCodec::maxFilenameLength(data_port))
                  + " characters)";
            return false;
        }
        config.request = TransferRequest::get(filename, data_port);
    }
    else {
        config.request = TransferRequest::unknown(data_port);
    }

    return true;
}

void CommandLine::applyEnvironment(ClientConfig& config) {
    if (const char* value = std::getenv("FTCLIENT_SEND_DELAY_MS")) {
        if (!parseDelay(value, config.send_delay))
            std::cerr << "[CommandLine] Ignoring invalid FTCLIENT_SEND_DELAY_MS: " << value << "\n";
    }
    if (const char* value = std::getenv("FTCLIENT_ACCEPT_DELAY_MS")) {
        if (!parseDelay(value, config.accept_delay))
            std::cerr << "[CommandLine] Ignoring invalid FTCLIENT_ACCEPT_DELAY_MS: " << value << "\n";
    }
    if (const char* value = std::getenv("FTCLIENT_LOG_FILE")) {
        config.log_file = value;
    }
}

void CommandLine::printUsage(std::ostream& out, const std::string& program) {
    out << "Usage:\n";
    out << "  " << program << " <server host> <control port> -l <data port>\n";
    out << "  " << program << " <server host> <control port> -g <filename> <data port>\n";
    out << "Available commands: List: -l or Get: -g <filename>\n";
}

bool CommandLine::parsePort(const std::string& text, int& port) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size() || !Protocol::isValidPort(value))
            return false;
        port = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

bool CommandLine::parseDelay(const char* text, std::chrono::milliseconds& delay) {
    try {
        std::string str = text;
        size_t consumed = 0;
        long value = std::stol(str, &consumed);
        if (consumed != str.size() || value < 0)
            return false;
        delay = std::chrono::milliseconds(value);
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}
