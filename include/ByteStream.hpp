#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

#include <string>
#include <sys/types.h>


/**
 * ByteStream - Reliable, ordered byte stream endpoint
 *
 * The payload handling code reads the control and data channels through
 * this interface, so it never touches a socket directly.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /**
     * Read up to max_length bytes
     * @return Bytes read, 0 on end of stream, -1 on error
     */
    virtual ssize_t read(char* buffer, size_t max_length) = 0;

    /**
     * Write all bytes
     * @return true on success, false on failure
     */
    virtual bool write(const char* data, size_t length) = 0;

    virtual void close() = 0;

    /**
     * Read one message (a single bounded read of MAX_MESSAGE_SIZE bytes)
     *
     * @param out Received bytes; empty when the peer has closed
     * @return false on a receive error
     */
    bool readMessage(std::string& out);

    bool write(const std::string& data) { return write(data.data(), data.size()); }
};


/**
 * SocketStream - ByteStream over a connected TCP socket
 *
 * Owns the descriptor; closes it on close() or destruction.
 */
class SocketStream : public ByteStream {
public:
    SocketStream(int fd, const std::string& peer);
    ~SocketStream() override;

    SocketStream(const SocketStream&) = delete;
    SocketStream& operator=(const SocketStream&) = delete;

    ssize_t read(char* buffer, size_t max_length) override;
    bool write(const char* data, size_t length) override;
    void close() override;

    using ByteStream::write;

    bool isOpen() const { return socket_fd != -1; }
    const std::string& peer() const { return peer_name; }

private:
    int socket_fd;
    std::string peer_name;
};

#endif // BYTE_STREAM_HPP
