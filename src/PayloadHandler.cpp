#include <fstream>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>

#include "ControlMessageCodec.hpp"
#include "PayloadHandler.hpp"

using Protocol::CommandKind;


PayloadHandler::PayloadHandler(std::istream& input, std::ostream& output,
                               std::filesystem::path download_dir)
    : input{input}, output{output}, download_dir{std::move(download_dir)} {}


TransferResult PayloadHandler::handle(const Protocol::TransferRequest& request,
                                      ByteStream& control, ByteStream& data) {
    switch (request.command()) {
        case CommandKind::LIST:
            return printListing(data);
        case CommandKind::GET:
            return receiveFile(request.filename().value_or(""), control, data);
        case CommandKind::UNKNOWN:
            // Servers reject UNKNOWN before connecting back; nothing to consume
            return TransferResult::IGNORED;
    }
    return TransferResult::IGNORED;
}

// ====================================================================================================
// Directory Listing
// ====================================================================================================

TransferResult PayloadHandler::printListing(ByteStream& data) {
    // The listing arrives as a single message
    std::string raw;
    if (!data.readMessage(raw)) {
        std::cerr << "[PayloadHandler] Failed to receive directory listing\n";
        return TransferResult::RECEIVE_FAILED;
    }

    output << "Directory contents:\n"
           << ControlMessageCodec::decodeText(raw) << "\n";
    return TransferResult::LISTED;
}

// ====================================================================================================
// File Transfer
// ====================================================================================================

TransferResult PayloadHandler::receiveFile(const std::string& filename,
                                           ByteStream& control, ByteStream& data) {
    // Deferred Error Check (e.g. file not found, reported after the ACK)
    std::string status;
    if (!control.readMessage(status)) {
        std::cerr << "[PayloadHandler] Failed to receive transfer status\n";
        return TransferResult::RECEIVE_FAILED;
    }

    Protocol::ControlReply reply = ControlMessageCodec::classify(status);
    if (reply.isError()) {
        output << "Message from server: " << reply.message << "\n";
        control.close();
        data.close();
        return TransferResult::SERVER_ERROR;
    }

    // Duplicate File Policy
    std::filesystem::path local_path = download_dir / filename;
    std::error_code ec;
    if (std::filesystem::is_regular_file(local_path, ec) && !confirmOverwrite(filename)) {
        output << "Transfer aborted.\n";
        return TransferResult::ABORTED;
    }

    output << "Transferring " << filename << ".\n";
    TransferResult result = streamToFile(local_path, data);
    if (result == TransferResult::SAVED) {
        output << "Transfer complete: " << filename << "\n";
    }
    return result;
}

bool PayloadHandler::confirmOverwrite(const std::string& filename) {
    output << filename << " already exists. Overwrite? N = no, anything else = yes\n";
    output.flush();

    // End of input counts as an empty answer
    std::string answer;
    std::getline(input, answer);
    return !(answer == "n" || answer == "N");
}

TransferResult PayloadHandler::streamToFile(const std::filesystem::path& local_path, ByteStream& data) {
    // Create File Stream, Open File
    std::ofstream file(local_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        std::cerr << "[PayloadHandler] Failed to open " << local_path << " for writing\n";
        return TransferResult::WRITE_FAILED;
    }

    auto discardPartial = [&]() {
        file.close();
        std::error_code ec;
        std::filesystem::remove(local_path, ec);
    };

    // Write Every Chunk Until the Server Closes the Data Connection
    char buffer[Protocol::MAX_MESSAGE_SIZE];
    while (true) {
        ssize_t n = data.read(buffer, sizeof(buffer));
        if (n == 0) break;
        if (n < 0) {
            std::cerr << "[PayloadHandler] Data connection failed while receiving " << local_path << "\n";
            discardPartial();
            return TransferResult::RECEIVE_FAILED;
        }

        file.write(buffer, n);
        if (!file.good()) {
            std::cerr << "[PayloadHandler] Failed to write " << local_path << "\n";
            discardPartial();
            return TransferResult::WRITE_FAILED;
        }
    }

    file.close();
    if (file.fail()) {
        std::cerr << "[PayloadHandler] Failed to finish writing " << local_path << "\n";
        std::error_code ec;
        std::filesystem::remove(local_path, ec);
        return TransferResult::WRITE_FAILED;
    }
    return TransferResult::SAVED;
}

// ====================================================================================================
// Result Helpers
// ====================================================================================================

bool PayloadHandler::isFailure(TransferResult result) {
    return result == TransferResult::RECEIVE_FAILED || result == TransferResult::WRITE_FAILED;
}

std::string PayloadHandler::resultName(TransferResult result) {
    switch (result) {
        case TransferResult::LISTED:         return "LISTED";
        case TransferResult::SAVED:          return "SAVED";
        case TransferResult::SERVER_ERROR:   return "SERVER_ERROR";
        case TransferResult::ABORTED:        return "ABORTED";
        case TransferResult::IGNORED:        return "IGNORED";
        case TransferResult::RECEIVE_FAILED: return "RECEIVE_FAILED";
        case TransferResult::WRITE_FAILED:   return "WRITE_FAILED";
    }
    return "UNKNOWN";
}
