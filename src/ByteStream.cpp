#include "ByteStream.hpp"
#include "NetworkUtils.hpp"
#include "Protocol.hpp"


bool ByteStream::readMessage(std::string& out) {
    char buffer[Protocol::MAX_MESSAGE_SIZE];
    ssize_t n = read(buffer, sizeof(buffer));
    if (n < 0) {
        out.clear();
        return false;
    }
    out.assign(buffer, static_cast<size_t>(n));
    return true;
}


SocketStream::SocketStream(int fd, const std::string& peer)
    : socket_fd{fd}, peer_name{peer} {}

SocketStream::~SocketStream() {
    close();
}

ssize_t SocketStream::read(char* buffer, size_t max_length) {
    if (socket_fd == -1) return -1;
    return NetworkUtils::receiveData(socket_fd, buffer, max_length);
}

bool SocketStream::write(const char* data, size_t length) {
    if (socket_fd == -1) return false;
    return NetworkUtils::sendData(socket_fd, data, length);
}

void SocketStream::close() {
    NetworkUtils::closeSocket(socket_fd);
}
