#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

#include "Protocol.hpp"

// Sanitize a log line (cut at the wire terminator, drop '#' padding, keep printable ASCII, cap length)
static std::string sanitize_wire_line(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c == static_cast<unsigned char>(Protocol::TERMINATOR_CHAR))
            break;
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
        else if (c == '\n')
            out += "\\n";
        // drop other control/binary
    }

    // Trailing request padding carries no information
    while (!out.empty() && out.back() == Protocol::PADDING_CHAR)
        out.pop_back();

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given session
Logger::Logger(std::string sessionID, std::string logfile)
    : sessionID{std::move(sessionID)}, logfile{std::move(logfile)} {

    // Ensure the log directory exists (safe if it already exists)
    if (!this->logfile.empty()) {
        std::filesystem::path dir = std::filesystem::path(this->logfile).parent_path();
        if (!dir.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
        }
    }
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::chrono::system_clock::to_time_t(std::chrono::system_clock::now())));
}

void Logger::logRequest(const std::string& request){
    logToFile(fmt::format("{} [{}]: Request: {}", getTime(), sessionID, sanitize_wire_line(request)));
}

void Logger::logReply(const std::string& reply){
    logToFile(fmt::format("{} [{}]: Reply: {}", getTime(), sessionID, sanitize_wire_line(reply)));
}

void Logger::logConnectionOpened(const std::string& host, int port){
    logToFile(fmt::format("{} [{}]: Connection opened to {}:{}", getTime(), sessionID, host, port));
}

void Logger::logConnectionClosed(const std::string& host, int port){
    logToFile(fmt::format("{} [{}]: Connection closed for {}:{}", getTime(), sessionID, host, port));
}

void Logger::logStateChange(const std::string& from, const std::string& to){
    logToFile(fmt::format("{} [{}]: State {} -> {}", getTime(), sessionID, from, to));
}

void Logger::logCustomMsg(const std::string& entry){
    logToFile(fmt::format("{} [{}]: {}", getTime(), sessionID, entry));
}


void Logger::logToFile(const std::string& entry){
    if (logfile.empty())
        return;

    std::ofstream out(logfile, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << logfile << "\n";
        return;
    }
    out << entry << '\n';
}
