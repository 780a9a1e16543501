#include "NetworkUtils.hpp"

#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <iostream>

// ====================================================================================================
// Connection Management
// ====================================================================================================

int NetworkUtils::connectToHost(const std::string& host, int port) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;      // IPv4 or IPv6
    hints.ai_socktype = SOCK_STREAM;  // TCP

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);

    // Perform DNS resolution
    int err = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (err != 0) {
        std::cerr << "[NetworkUtils] DNS resolution failed for " << host
                  << ": " << gai_strerror(err) << "\n";
        return -1;
    }

    // Try each resolved address until one connects
    int sock_fd = -1;
    int last_errno = 0;
    for (struct addrinfo* ai = res; ai != nullptr; ai = ai->ai_next) {
        sock_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock_fd < 0) {
            last_errno = errno;
            continue;
        }

        if (connect(sock_fd, ai->ai_addr, ai->ai_addrlen) == 0)
            break;

        last_errno = errno;
        close(sock_fd);
        sock_fd = -1;
    }
    freeaddrinfo(res);

    if (sock_fd < 0) {
        std::cerr << "[NetworkUtils] Failed to connect to "
                  << host << ":" << port
                  << " (" << strerror(last_errno) << ")\n";
        return -1;
    }

    return sock_fd;
}

// ====================================================================================================
// Data Transmission
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const char* data, size_t length) {
    size_t total_sent = 0;

    while (total_sent < length) {
        ssize_t sent = send(fd, data + total_sent, length - total_sent, MSG_NOSIGNAL);

        if (sent < 0) {
            if (errno == EINTR) continue;
            std::cerr << "[NetworkUtils] Send failed: " << strerror(errno) << "\n";
            return false;
        }

        if (sent == 0) {
            std::cerr << "[NetworkUtils] Connection closed during send\n";
            return false;
        }

        total_sent += sent;
    }

    return true;
}

// ====================================================================================================
// Data Reception
// ====================================================================================================

ssize_t NetworkUtils::receiveData(int fd, char* buffer, size_t max_length) {
    ssize_t received;
    do {
        received = recv(fd, buffer, max_length, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        std::cerr << "[NetworkUtils] Receive failed: " << strerror(errno) << "\n";
        return -1;
    }

    // 0 means the peer closed the connection (not necessarily an error)
    return received;
}

// ====================================================================================================
// Socket Lifetime
// ====================================================================================================

void NetworkUtils::closeSocket(int& fd) {
    if (fd != -1) {
        close(fd);
        fd = -1;
    }
}

// ====================================================================================================
// Error Handling
// ====================================================================================================

std::string NetworkUtils::getLastError() {
    return std::string(strerror(errno));
}
