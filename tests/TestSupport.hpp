#ifndef TEST_SUPPORT_HPP
#define TEST_SUPPORT_HPP

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <utility>

#include "ByteStream.hpp"
#include "DataChannelListener.hpp"
#include "NetworkUtils.hpp"
#include "Protocol.hpp"


// In-memory ByteStream: hands out queued chunks, then end of stream (or an error)
class MemoryStream : public ByteStream {
public:
    MemoryStream() = default;
    explicit MemoryStream(std::deque<std::string> chunks) : chunks{std::move(chunks)} {}

    ssize_t read(char* buffer, size_t max_length) override {
        ++read_calls;
        if (chunks.empty())
            return fail_at_end ? -1 : 0;

        std::string& front = chunks.front();
        size_t n = std::min(max_length, front.size());
        std::memcpy(buffer, front.data(), n);
        front.erase(0, n);
        if (front.empty())
            chunks.pop_front();
        return static_cast<ssize_t>(n);
    }

    bool write(const char* data, size_t length) override {
        written.append(data, length);
        return true;
    }

    void close() override { closed = true; }

    using ByteStream::write;

    std::deque<std::string> chunks;
    std::string written;
    bool fail_at_end = false;
    bool closed = false;
    int read_calls = 0;
};


// Scratch directory removed at end of scope
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "ftclient_test_XXXXXX").string();
        char* created = mkdtemp(pattern.data());
        dir = created ? std::filesystem::path(created) : std::filesystem::temp_directory_path();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    const std::filesystem::path& path() const { return dir; }

    void writeFile(const std::string& name, const std::string& contents) const {
        std::ofstream out(dir / name, std::ios::binary);
        out << contents;
    }

    std::string readFile(const std::string& name) const {
        std::ifstream in(dir / name, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

private:
    std::filesystem::path dir;
};


// A port that was free a moment ago
inline int findFreePort() {
    DataChannelListener probe;
    if (!probe.open(0)) return 0;
    return probe.port();
}

inline std::unique_ptr<SocketStream> connectBack(int port) {
    int fd = NetworkUtils::connectToHost("127.0.0.1", port);
    if (fd < 0) return nullptr;
    return std::make_unique<SocketStream>(fd, "127.0.0.1:" + std::to_string(port));
}

// Read until the peer closes the connection
inline void drainUntilClosed(SocketStream& stream) {
    std::string chunk;
    while (stream.readMessage(chunk) && !chunk.empty()) {}
}


/**
 * Loopback stand-in for the server: accepts one control connection,
 * reads the fixed-size request, then runs the scripted reply.
 */
class FakeServer {
public:
    using Script = std::function<void(SocketStream& control, const std::string& request)>;

    FakeServer() { listening = listener.open(0); }

    ~FakeServer() { join(); }

    bool isListening() const { return listening; }
    int port() const { return listener.port(); }

    void start(Script script) {
        worker = std::thread([this, script]() {
            std::unique_ptr<SocketStream> control = listener.acceptOnce();
            if (!control) return;

            char buffer[Protocol::WIRE_REQUEST_SIZE];
            while (received.size() < Protocol::WIRE_REQUEST_SIZE) {
                ssize_t n = control->read(buffer, Protocol::WIRE_REQUEST_SIZE - received.size());
                if (n <= 0) break;
                received.append(buffer, static_cast<size_t>(n));
            }
            script(*control, received);
        });
    }

    void join() {
        if (worker.joinable()) worker.join();
    }

    // Valid after join()
    const std::string& request() const { return received; }

private:
    DataChannelListener listener;
    bool listening = false;
    std::thread worker;
    std::string received;
};

#endif // TEST_SUPPORT_HPP
