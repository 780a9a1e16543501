#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "ControlMessageCodec.hpp"
#include "NetworkUtils.hpp"
#include "TransferSession.hpp"


std::string toString(SessionState state) {
    switch (state) {
        case SessionState::INIT:              return "INIT";
        case SessionState::LISTENING:         return "LISTENING";
        case SessionState::CONTROL_CONNECTED: return "CONTROL_CONNECTED";
        case SessionState::REQUEST_SENT:      return "REQUEST_SENT";
        case SessionState::REPLY_RECEIVED:    return "REPLY_RECEIVED";
        case SessionState::DATA_CONNECTED:    return "DATA_CONNECTED";
        case SessionState::TRANSFERRING:      return "TRANSFERRING";
        case SessionState::DONE:              return "DONE";
        case SessionState::FAILED:            return "FAILED";
    }
    return "UNKNOWN";
}


TransferSession::TransferSession(const ClientConfig& config, std::istream& input,
                                 std::ostream& output, Logger& logger)
    : config{config}, output{output}, logger{logger},
      payload_handler{input, output, config.download_dir} {
    history.push_back(current_state);
}

TransferSession::~TransferSession() {
    cleanup();
}

// ====================================================================================================
// State Machine Driver
// ====================================================================================================

int TransferSession::run() {
    while (current_state != SessionState::DONE && current_state != SessionState::FAILED) {
        SessionState next = SessionState::FAILED;

        switch (current_state) {
            case SessionState::INIT:              next = openListener();    break;
            case SessionState::LISTENING:         next = connectControl();  break;
            case SessionState::CONTROL_CONNECTED: next = sendRequest();     break;
            case SessionState::REQUEST_SENT:      next = receiveReply();    break;
            case SessionState::REPLY_RECEIVED:    next = handleReply();     break;
            case SessionState::DATA_CONNECTED:    next = prepareTransfer(); break;
            case SessionState::TRANSFERRING:      next = transfer();        break;
            case SessionState::DONE:
            case SessionState::FAILED:
                break;
        }

        transitionTo(next);
    }

    return finish();
}

void TransferSession::transitionTo(SessionState next) {
    logger.logStateChange(toString(current_state), toString(next));
    current_state = next;
    history.push_back(next);
}

int TransferSession::finish() {
    bool transferred = (history.size() > 1 &&
                        history[history.size() - 2] == SessionState::TRANSFERRING);
    cleanup();

    if (current_state == SessionState::FAILED) {
        logger.logCustomMsg("Session failed");
        return EXIT_FAILURE;
    }

    if (transferred) {
        output << "** Operations complete. Closing connections. **\n";
    }
    logger.logCustomMsg("Session complete");
    return EXIT_SUCCESS;
}

// ====================================================================================================
// State Handlers
// ====================================================================================================

SessionState TransferSession::openListener() {
    const Protocol::TransferRequest& request = config.request;

    if (!ControlMessageCodec::fits(request)) {
        std::cerr << "[TransferSession] Request does not fit into "
                  << Protocol::WIRE_REQUEST_SIZE << " bytes\n";
        return SessionState::FAILED;
    }

    // Listen before the request naming this port goes out
    if (!listener.open(request.dataPort())) {
        std::cerr << "[TransferSession] Could not listen on data port " << request.dataPort() << "\n";
        return SessionState::FAILED;
    }

    output << "Listening on data port " << listener.port() << "\n";
    logger.logCustomMsg("Listening on data port " + std::to_string(listener.port()));
    return SessionState::LISTENING;
}

SessionState TransferSession::connectControl() {
    int control_fd = NetworkUtils::connectToHost(config.server_host, config.control_port);
    if (control_fd < 0) {
        std::cerr << "[TransferSession] Could not connect to " << config.server_host
                  << ":" << config.control_port << "\n";
        return SessionState::FAILED;
    }

    control = std::make_unique<SocketStream>(
        control_fd, config.server_host + ":" + std::to_string(config.control_port));
    logger.logConnectionOpened(config.server_host, config.control_port);
    return SessionState::CONTROL_CONNECTED;
}

SessionState TransferSession::sendRequest() {
    // Give slow servers time to get back to their read
    if (config.send_delay.count() > 0)
        std::this_thread::sleep_for(config.send_delay);

    std::string wire = ControlMessageCodec::encode(config.request);
    if (!control->write(wire)) {
        std::cerr << "[TransferSession] Failed to send request\n";
        return SessionState::FAILED;
    }

    logger.logRequest(wire);
    logger.logCustomMsg("Sent " + ControlMessageCodec::commandName(config.request.command()) + " request");
    return SessionState::REQUEST_SENT;
}

SessionState TransferSession::receiveReply() {
    std::string raw;
    if (!control->readMessage(raw)) {
        std::cerr << "[TransferSession] Failed to receive reply from server\n";
        return SessionState::FAILED;
    }

    // Without any reply the server will never connect back
    if (raw.empty()) {
        std::cerr << "[TransferSession] Server closed the control connection without replying\n";
        return SessionState::FAILED;
    }

    reply = ControlMessageCodec::classify(raw);
    logger.logReply(reply.message);
    return SessionState::REPLY_RECEIVED;
}

SessionState TransferSession::handleReply() {
    // Server-reported errors end the session normally
    if (reply.isError()) {
        output << reply.message << "\n";
        logger.logCustomMsg("Server reported error: " + reply.message);
        logger.logConnectionClosed(config.server_host, config.control_port);
        control->close();
        listener.close();
        return SessionState::DONE;
    }

    output << "Connected to ftserver on control port " << config.control_port << "\n";

    // Blocks until the server connects back
    data = listener.acceptOnce();
    if (!data) {
        std::cerr << "[TransferSession] Failed to accept data connection\n";
        return SessionState::FAILED;
    }

    output << "ftserver connected on data port " << listener.port() << "\n";
    logger.logCustomMsg("Data connection accepted from " + data->peer());
    return SessionState::DATA_CONNECTED;
}

SessionState TransferSession::prepareTransfer() {
    // Let the server start writing before the first read
    if (config.accept_delay.count() > 0)
        std::this_thread::sleep_for(config.accept_delay);
    return SessionState::TRANSFERRING;
}

SessionState TransferSession::transfer() {
    transfer_result = payload_handler.handle(config.request, *control, *data);
    logger.logCustomMsg("Transfer result: " + PayloadHandler::resultName(transfer_result));

    if (PayloadHandler::isFailure(transfer_result))
        return SessionState::FAILED;
    return SessionState::DONE;
}

// ====================================================================================================
// Cleanup
// ====================================================================================================

void TransferSession::cleanup() {
    if (data && data->isOpen()) {
        logger.logCustomMsg("Closing data connection " + data->peer());
    }
    if (data) data->close();

    if (control && control->isOpen()) {
        logger.logConnectionClosed(config.server_host, config.control_port);
    }
    if (control) control->close();

    listener.close();
}
