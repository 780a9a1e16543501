#ifndef DATA_CHANNEL_LISTENER_HPP
#define DATA_CHANNEL_LISTENER_HPP

#include <memory>

#include "ByteStream.hpp"


/**
 * DataChannelListener - Listening socket for the server-initiated data connection
 *
 * Must be opened before the request advertising its port is sent, so the
 * server's connect-back always finds a listening socket. Accepts exactly
 * one connection over its lifetime.
 */
class DataChannelListener {
public:
    DataChannelListener() = default;
    ~DataChannelListener();

    DataChannelListener(const DataChannelListener&) = delete;
    DataChannelListener& operator=(const DataChannelListener&) = delete;

    /**
     * Bind to the port on all interfaces (address reuse enabled) and listen
     *
     * @param port Port to listen on; 0 picks an ephemeral port
     * @return true on success, false if the port is unavailable
     */
    bool open(int port);

    /**
     * Block until the single inbound connection arrives
     *
     * @return Connected stream, or nullptr on failure or when a connection
     *         was already accepted
     */
    std::unique_ptr<SocketStream> acceptOnce();

    /**
     * Stop listening. Safe to call repeatedly.
     */
    void close();

    bool isOpen() const { return socket_fd != -1; }

    // Port actually bound (resolves an ephemeral request)
    int port() const { return bound_port; }

private:
    int socket_fd = -1;
    int bound_port = 0;
    bool accepted = false;
};

#endif // DATA_CHANNEL_LISTENER_HPP
