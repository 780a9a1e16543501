#include <utility>

#include "Protocol.hpp"

namespace Protocol {

    TransferRequest::TransferRequest(CommandKind command, std::optional<std::string> filename, int data_port)
        : command_{command}, filename_{std::move(filename)}, data_port_{data_port} {}

    TransferRequest TransferRequest::list(int data_port) {
        return TransferRequest(CommandKind::LIST, std::nullopt, data_port);
    }

    TransferRequest TransferRequest::get(const std::string& filename, int data_port) {
        return TransferRequest(CommandKind::GET, filename, data_port);
    }

    TransferRequest TransferRequest::unknown(int data_port) {
        return TransferRequest(CommandKind::UNKNOWN, std::nullopt, data_port);
    }

    bool isValidPort(int port) {
        return port >= MIN_PORT && port <= MAX_PORT;
    }

} // namespace Protocol
