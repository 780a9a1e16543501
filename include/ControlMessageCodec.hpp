#ifndef CONTROL_MESSAGE_CODEC_HPP
#define CONTROL_MESSAGE_CODEC_HPP

#include <string>
#include <string_view>

#include "Protocol.hpp"

/**
 * ControlMessageCodec - Text encoding for the control channel
 *
 * Responsibilities:
 * - Encode a TransferRequest into the fixed 100-byte wire request
 * - Decode received bytes into text
 * - Classify a server reply as acknowledgement or error
 *
 * Works on strings only; no socket access. Static methods only.
 */
class ControlMessageCodec {
public:
    /**
     * Encode a request into its wire form
     *
     * Layout: PORTSTART:<port>PORTEND CMD:<body> '#'-padding '\0'
     * The result is exactly WIRE_REQUEST_SIZE bytes when fits(request) holds.
     * Otherwise the unpadded content is followed directly by the terminator.
     *
     * @param request Request to encode
     * @return Wire request string (may contain the embedded terminator byte)
     */
    static std::string encode(const Protocol::TransferRequest& request);

    /**
     * Check whether the unpadded request content fits into WIRE_DATA_SIZE bytes
     */
    static bool fits(const Protocol::TransferRequest& request);

    /**
     * Longest filename a GET request for the given data port can carry
     */
    static size_t maxFilenameLength(int data_port);

    /**
     * Decode received bytes as text, stripping trailing newlines
     */
    static std::string decodeText(std::string_view raw);

    /**
     * Classify a control-channel reply
     *
     * Any reply containing "ERROR" (case-sensitive, anywhere) is an error,
     * everything else is an acknowledgement.
     *
     * @param raw Bytes read from the control channel
     * @return Reply kind and decoded text
     */
    static Protocol::ControlReply classify(std::string_view raw);

    static std::string commandName(Protocol::CommandKind command);

private:
    static std::string unpaddedContent(const Protocol::TransferRequest& request);

    ControlMessageCodec() = delete;
};

#endif // CONTROL_MESSAGE_CODEC_HPP
