#ifndef PROTOCOL_HPP
#define PROTOCOL_HPP

#include <cstddef>
#include <optional>
#include <string>


namespace Protocol {

    enum class CommandKind {
        LIST,
        GET,
        UNKNOWN
    };

    // Wire Layout Markers
    inline constexpr const char* PORT_START     = "PORTSTART:";
    inline constexpr const char* PORT_END       = "PORTEND";
    inline constexpr const char* COMMAND_START  = "CMD:";
    inline constexpr const char* FILENAME_START = "FILENAME:";
    inline constexpr const char* FILENAME_END   = "FILENAMEEND";
    inline constexpr const char* ERROR_MARKER   = "ERROR";

    constexpr size_t WIRE_REQUEST_SIZE = 100;                   // 99 data bytes + terminator
    constexpr size_t WIRE_DATA_SIZE    = WIRE_REQUEST_SIZE - 1;
    constexpr char   PADDING_CHAR      = '#';
    constexpr char   TERMINATOR_CHAR   = '\0';

    constexpr size_t MAX_MESSAGE_SIZE  = 1024;                  // Single read on either channel

    constexpr int MIN_PORT = 1;
    constexpr int MAX_PORT = 65535;

    /**
     * TransferRequest - What the client asks the server for
     *
     * Only constructible through the factories below, so that a filename
     * is present exactly when the command is GET.
     */
    class TransferRequest {
    public:
        static TransferRequest list(int data_port);
        static TransferRequest get(const std::string& filename, int data_port);
        static TransferRequest unknown(int data_port);

        CommandKind command() const { return command_; }
        const std::optional<std::string>& filename() const { return filename_; }
        int dataPort() const { return data_port_; }

        bool operator==(const TransferRequest& other) const = default;

    private:
        TransferRequest(CommandKind command, std::optional<std::string> filename, int data_port);

        CommandKind command_;
        std::optional<std::string> filename_;
        int data_port_;
    };

    enum class ReplyKind {
        ACK,
        ERROR
    };

    struct ControlReply {
        ReplyKind kind;
        std::string message;

        bool isError() const { return kind == ReplyKind::ERROR; }
    };

    bool isValidPort(int port);

} // namespace Protocol

#endif // PROTOCOL_HPP
