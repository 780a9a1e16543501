#include <iostream>
#include <string>
#include <unistd.h>

#include "ClientConfig.hpp"
#include "CommandLine.hpp"
#include "Logger.hpp"
#include "TransferSession.hpp"


int main(int argc, char* argv[]) {
    // Argument Parsing
    ClientConfig config;
    std::string error;
    if (!CommandLine::parse(argc, argv, config, error)) {
        std::cerr << "Error: " << error << "\n";
        CommandLine::printUsage(std::cerr, argv[0]);
        return 1;
    }
    CommandLine::applyEnvironment(config);

    // One log identity per process
    Logger logger("ftclient-" + std::to_string(getpid()), config.log_file);

    // Run the Transfer
    TransferSession session(config, std::cin, std::cout, logger);
    return session.run();
}
