#ifndef TRANSFER_SESSION_HPP
#define TRANSFER_SESSION_HPP

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

#include "ByteStream.hpp"
#include "ClientConfig.hpp"
#include "DataChannelListener.hpp"
#include "Logger.hpp"
#include "PayloadHandler.hpp"
#include "Protocol.hpp"


enum class SessionState {
    INIT,
    LISTENING,
    CONTROL_CONNECTED,
    REQUEST_SENT,
    REPLY_RECEIVED,
    DATA_CONNECTED,
    TRANSFERRING,
    DONE,
    FAILED
};

std::string toString(SessionState state);

/**
 * TransferSession - One request/transfer exchange with the server
 *
 * Drives the handshake as an explicit state machine:
 *
 *   INIT -> LISTENING -> CONTROL_CONNECTED -> REQUEST_SENT -> REPLY_RECEIVED
 *        -> DATA_CONNECTED -> TRANSFERRING -> DONE
 *
 * Any step may fail into FAILED. A server-reported error ends in DONE
 * without ever accepting the data connection. The reply is classified as
 * usual with one exception: a control connection closed before any reply
 * arrives is FAILED rather than an acknowledgement, since the server will
 * not connect back.
 *
 * Every socket the session opened is closed on the way out of DONE or FAILED.
 */
class TransferSession {
public:
    /**
     * @param config Server address, request, delays and storage settings
     * @param input Source of the overwrite prompt answer
     * @param output Destination of user-facing messages
     * @param logger Session log
     */
    TransferSession(const ClientConfig& config, std::istream& input,
                    std::ostream& output, Logger& logger);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /**
     * Run the session to completion
     *
     * @return Process exit code: 0 for success, server-reported errors
     *         and user aborts; 1 for local failures
     */
    int run();

    SessionState state() const { return current_state; }
    const std::vector<SessionState>& transitions() const { return history; }
    TransferResult result() const { return transfer_result; }

    /**
     * Close every socket still open. Safe to call repeatedly.
     */
    void cleanup();

private:
    ClientConfig config;
    std::ostream& output;
    Logger& logger;
    PayloadHandler payload_handler;

    SessionState current_state = SessionState::INIT;
    std::vector<SessionState> history;
    TransferResult transfer_result = TransferResult::IGNORED;
    Protocol::ControlReply reply{Protocol::ReplyKind::ACK, ""};

    DataChannelListener listener;
    std::unique_ptr<SocketStream> control;
    std::unique_ptr<SocketStream> data;

    // State handlers; each returns the next state
    SessionState openListener();
    SessionState connectControl();
    SessionState sendRequest();
    SessionState receiveReply();     // Empty read (peer closed) -> FAILED
    SessionState handleReply();
    SessionState prepareTransfer();
    SessionState transfer();

    void transitionTo(SessionState next);
    int finish();
};

#endif // TRANSFER_SESSION_HPP
