#include <string>

#include "ControlMessageCodec.hpp"

using Protocol::CommandKind;
using Protocol::ControlReply;
using Protocol::ReplyKind;
using Protocol::TransferRequest;

// ====================================================================================================
// Request Encoding
// ====================================================================================================

std::string ControlMessageCodec::unpaddedContent(const TransferRequest& request) {
    std::string content = Protocol::PORT_START;
    content += std::to_string(request.dataPort());
    content += Protocol::PORT_END;
    content += Protocol::COMMAND_START;

    switch (request.command()) {
        case CommandKind::LIST:
            content += "LIST";
            break;
        case CommandKind::GET:
            content += "GET";
            content += Protocol::FILENAME_START;
            content += request.filename().value_or("");
            content += Protocol::FILENAME_END;
            break;
        case CommandKind::UNKNOWN:
            content += "UNKNOWN";
            break;
    }
    return content;
}

std::string ControlMessageCodec::encode(const TransferRequest& request) {
    std::string wire = unpaddedContent(request);

    // Server reads a fixed-size request; pad the remainder
    if (wire.size() < Protocol::WIRE_DATA_SIZE)
        wire.append(Protocol::WIRE_DATA_SIZE - wire.size(), Protocol::PADDING_CHAR);

    wire.push_back(Protocol::TERMINATOR_CHAR);
    return wire;
}

bool ControlMessageCodec::fits(const TransferRequest& request) {
    return unpaddedContent(request).size() <= Protocol::WIRE_DATA_SIZE;
}

size_t ControlMessageCodec::maxFilenameLength(int data_port) {
    std::string overhead = unpaddedContent(TransferRequest::get("", data_port));
    if (overhead.size() >= Protocol::WIRE_DATA_SIZE)
        return 0;
    return Protocol::WIRE_DATA_SIZE - overhead.size();
}

// ====================================================================================================
// Reply Decoding
// ====================================================================================================

std::string ControlMessageCodec::decodeText(std::string_view raw) {
    std::string text(raw);
    while (!text.empty() && text.back() == '\n')
        text.pop_back();
    return text;
}

ControlReply ControlMessageCodec::classify(std::string_view raw) {
    std::string text = decodeText(raw);
    if (text.find(Protocol::ERROR_MARKER) != std::string::npos)
        return ControlReply{ReplyKind::ERROR, text};
    return ControlReply{ReplyKind::ACK, text};
}

std::string ControlMessageCodec::commandName(CommandKind command) {
    switch (command) {
        case CommandKind::LIST:    return "LIST";
        case CommandKind::GET:     return "GET";
        case CommandKind::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}
