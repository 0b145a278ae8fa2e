#include <string>
#include "HTTPMessage.hpp"
#ifndef LOGGER_HPP
#define LOGGER_HPP

class Logger {
    public:
        Logger(std::string clientID, std::string logfile = "logs/log.txt");
        void logRequest(const HTTP::HttpRequest& request); //Log the request line and timestamp
        void logResponse(const std::string& response); //Log the status line and timestamp
        void logConnectionOpened(const std::string& host, int port); //Log connection opening
        void logConnectionClosed(const std::string& host, int port); //Log connection closure
        void logCustomMsg(const std::string& entry); //Log custom message
        void logError(const std::string& entry); //Log error, also echoed to stderr
        const std::string& getLogFile() const { return logfile; }
    private:
        std::string clientID;
        std::string logfile;
        const std::string getTime();
        void logToFile(const std::string& entry);
};

#endif // LOGGER_HPP
