#include <iostream>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "DataChannelListener.hpp"
#include "NetworkUtils.hpp"


DataChannelListener::~DataChannelListener() {
    close();
}

bool DataChannelListener::open(int port) {
    if (socket_fd != -1) {
        std::cerr << "[DataChannelListener] Already listening on port " << bound_port << "\n";
        return false;
    }

    // Create a TCP Socket
    socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        std::cerr << "[DataChannelListener] Failed to create socket: "
                  << NetworkUtils::getLastError() << "\n";
        socket_fd = -1;
        return false;
    }

    // Set Socket Options to Allow Reuse of Address
    int opt = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        std::cerr << "[DataChannelListener] Failed to set socket options: "
                  << NetworkUtils::getLastError() << "\n";
        close();
        return false;
    }

    // Prepare the sockaddr_in Structure
    sockaddr_in listen_addr{};
    listen_addr.sin_family = AF_INET;
    listen_addr.sin_addr.s_addr = INADDR_ANY;
    listen_addr.sin_port = htons(static_cast<uint16_t>(port));

    // Bind the Socket to the Port
    if (bind(socket_fd, (struct sockaddr*)&listen_addr, sizeof(listen_addr)) < 0) {
        std::cerr << "[DataChannelListener] Failed to bind to port " << port
                  << " (" << NetworkUtils::getLastError() << ")\n";
        close();
        return false;
    }

    // Start Listening for the Server's Connection
    if (listen(socket_fd, 1) < 0) {
        std::cerr << "[DataChannelListener] Failed to listen on port " << port
                  << " (" << NetworkUtils::getLastError() << ")\n";
        close();
        return false;
    }

    // Resolve the Bound Port
    sockaddr_in bound_addr{};
    socklen_t bound_len = sizeof(bound_addr);
    if (getsockname(socket_fd, (struct sockaddr*)&bound_addr, &bound_len) == 0) {
        bound_port = ntohs(bound_addr.sin_port);
    } else {
        bound_port = port;
    }

    accepted = false;
    return true;
}

std::unique_ptr<SocketStream> DataChannelListener::acceptOnce() {
    if (socket_fd == -1) {
        std::cerr << "[DataChannelListener] Not listening\n";
        return nullptr;
    }
    if (accepted) {
        std::cerr << "[DataChannelListener] Data connection already accepted\n";
        return nullptr;
    }

    // Prepare to Accept a Connection
    sockaddr_in peer_addr{};
    socklen_t peer_len = sizeof(peer_addr);

    // Accept the Incoming Connection
    int data_fd;
    do {
        data_fd = accept(socket_fd, (struct sockaddr*)&peer_addr, &peer_len);
    } while (data_fd < 0 && errno == EINTR);

    if (data_fd < 0) {
        std::cerr << "[DataChannelListener] Failed to accept connection: "
                  << NetworkUtils::getLastError() << "\n";
        return nullptr;
    }
    accepted = true;

    char peer_ip[INET_ADDRSTRLEN] = {};
    inet_ntop(AF_INET, &peer_addr.sin_addr, peer_ip, sizeof(peer_ip));
    std::string peer = std::string(peer_ip) + ":" + std::to_string(ntohs(peer_addr.sin_port));

    return std::make_unique<SocketStream>(data_fd, peer);
}

void DataChannelListener::close() {
    NetworkUtils::closeSocket(socket_fd);
}
