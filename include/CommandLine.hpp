#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <iosfwd>
#include <string>

#include "ClientConfig.hpp"

/**
 * CommandLine - Argument parsing for the client
 *
 * Usage: ftclient <server host> <control port> <-l | -g <filename>> <data port>
 *
 * Any other command token is forwarded to the server as UNKNOWN.
 */
class CommandLine {
public:
    /**
     * Fill the config from argv
     *
     * @param argc Argument count
     * @param argv Argument vector
     * @param config Output configuration
     * @param error Description of the usage error on failure
     * @return true if the invocation is well formed
     */
    static bool parse(int argc, const char* const argv[], ClientConfig& config, std::string& error);

    /**
     * Apply FTCLIENT_SEND_DELAY_MS, FTCLIENT_ACCEPT_DELAY_MS and FTCLIENT_LOG_FILE
     *
     * Invalid values are reported and ignored.
     */
    static void applyEnvironment(ClientConfig& config);

    static void printUsage(std::ostream& out, const std::string& program);

private:
    static bool parsePort(const std::string& text, int& port);
    static bool parseDelay(const char* text, std::chrono::milliseconds& delay);

    CommandLine() = delete;
};

#endif // COMMAND_LINE_HPP
