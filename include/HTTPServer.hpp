#ifndef HTTP_SERVER_HPP
#define HTTP_SERVER_HPP

#include "BaseServer.hpp"
#include "HTTPMessage.hpp"
#include "HTTPResponse.hpp"
#include "Logger.hpp"
#include "ServerConfig.hpp"
#include <string>

/**
 * HTTPServer - Multi-threaded HTTP echo server
 * 
 * Reads one request per connection, parses it, and replies with a plain-text
 * description of what was parsed. The connection is closed after each response.
 * 
 * Components:
 * - HTTPRequestParser: Parses incoming HTTP requests
 * - HTTPResponse: Builds the reply
 * - ErrorResponseBuilder: Generates error pages
 * - Logger: Records requests and responses
 */
class HTTPServer : public BaseServer {
public:
    /**
     * Constructor
     * @param config Port, log file and timeout settings
     */
    explicit HTTPServer(const ServerConfig& config);

    /**
     * Choose the reply for a parsed request
     * 
     * - Unknown method  -> 400 Bad Request
     * - Unknown version -> 505 HTTP Version Not Supported
     * - HEAD            -> 200 with echo headers and no body
     * - Otherwise       -> 200 with the echo body
     * 
     * @param request Parsed request
     * @return Response to send
     */
    static HTTPResponse respond(const HTTP::HttpRequest& request);

    /**
     * Plain-text description of a parsed request
     * 
     * @param request Parsed request
     * @return One "field: value" line per request field, headers indented
     */
    static std::string describe(const HTTP::HttpRequest& request);

protected:
    /**
     * Handle a client connection
     * This is called by BaseServer for each accepted connection
     * 
     * @param client_fd Client socket file descriptor
     * @param client_host Peer address
     * @param client_port Peer port
     */
    void handleRequest(int client_fd, const std::string& client_host, int client_port) override;

private:
    ServerConfig config;

    /**
     * Log the status line and send the response
     * 
     * @param client_fd Client socket file descriptor
     * @param logger Connection logger
     * @param reply Response to send
     */
    static void sendResponse(int client_fd, Logger& logger, const HTTPResponse& reply);
};

#endif // HTTP_SERVER_HPP
