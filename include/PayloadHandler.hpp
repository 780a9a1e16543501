#ifndef PAYLOAD_HANDLER_HPP
#define PAYLOAD_HANDLER_HPP

#include <filesystem>
#include <iosfwd>
#include <string>

#include "ByteStream.hpp"
#include "Protocol.hpp"


enum class TransferResult {
    LISTED,          // Directory listing printed
    SAVED,           // File stored locally
    SERVER_ERROR,    // Server reported an error after acknowledging
    ABORTED,         // User declined to overwrite an existing file
    IGNORED,         // Nothing to consume for this command
    RECEIVE_FAILED,  // Data or control channel read failed
    WRITE_FAILED     // Local file could not be written
};

/**
 * PayloadHandler - Consumes the data channel according to the command
 *
 * - LIST: prints the single listing message
 * - GET: checks the control channel for a deferred error, applies the
 *   overwrite policy, then streams the data channel into a local file
 *   until the server closes it
 */
class PayloadHandler {
public:
    /**
     * @param input Source of the overwrite prompt answer
     * @param output Destination of user-facing messages
     * @param download_dir Directory files are stored in
     */
    PayloadHandler(std::istream& input, std::ostream& output,
                   std::filesystem::path download_dir = ".");

    TransferResult handle(const Protocol::TransferRequest& request,
                          ByteStream& control, ByteStream& data);

    static bool isFailure(TransferResult result);
    static std::string resultName(TransferResult result);

private:
    std::istream& input;
    std::ostream& output;
    std::filesystem::path download_dir;

    TransferResult printListing(ByteStream& data);
    TransferResult receiveFile(const std::string& filename, ByteStream& control, ByteStream& data);

    bool confirmOverwrite(const std::string& filename);
    TransferResult streamToFile(const std::filesystem::path& local_path, ByteStream& data);
};

#endif // PAYLOAD_HANDLER_HPP
