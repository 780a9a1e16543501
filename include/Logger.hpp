#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>

class Logger {
    public:
        Logger(std::string sessionID, std::string logfile = "logs/ftclient.log");
        void logRequest(const std::string& request); //Log the wire request (padding stripped)
        void logReply(const std::string& reply); //Log a control channel reply
        void logConnectionOpened(const std::string& host, int port); //Log connection opening
        void logConnectionClosed(const std::string& host, int port); //Log connection closure
        void logStateChange(const std::string& from, const std::string& to); //Log a session state transition
        void logCustomMsg(const std::string& entry); //Log custom message

        const std::string& getLogFile() const { return logfile; }
    private:
        std::string sessionID;
        std::string logfile; // Empty disables file output
        const std::string getTime();
        void logToFile(const std::string& entry);
};

#endif // LOGGER_HPP
