#include "HTTPServer.hpp"
#include "HTTPRequestParser.hpp"
#include "ErrorResponseBuilder.hpp"
#include "Logger.hpp"
#include "NetworkUtils.hpp"
#include "StatusCodes.hpp"

#include <fmt/format.h>

// ====================================================================================================
// Constructor
// ====================================================================================================
HTTPServer::HTTPServer(const ServerConfig& config)
    : BaseServer(config.port), config(config) {}

// ====================================================================================================
// Main Request Handler
// ====================================================================================================
void HTTPServer::handleRequest(int client_fd, const std::string& client_host, int client_port) {
    Logger logger(fmt::format("{}:{}", client_host, client_port), config.log_file);
    logger.logConnectionOpened(client_host, client_port);

    NetworkUtils::setSocketTimeout(client_fd, config.read_timeout_seconds);

    // -------------------------------------------------------
    // STEP 1: Read and parse client request
    // -------------------------------------------------------
    std::string raw;
    NetworkUtils::ReadStatus status = NetworkUtils::readRequest(
        client_fd, {config.max_header_bytes, config.max_body_bytes}, raw);

    if (status != NetworkUtils::ReadStatus::OK) {
        if (status == NetworkUtils::ReadStatus::HEADERS_TOO_LARGE) {
            sendResponse(client_fd, logger, ErrorResponseBuilder::build(
                StatusCodes::REQUEST_HEADER_FIELDS_TOO_LARGE, "Header block exceeds the server limit"));
        } else if (status == NetworkUtils::ReadStatus::BODY_TOO_LARGE) {
            sendResponse(client_fd, logger, ErrorResponseBuilder::build(
                StatusCodes::PAYLOAD_TOO_LARGE, "Content-Length exceeds the server limit"));
        } else {
            logger.logCustomMsg("Client sent no complete request");
        }
        logger.logConnectionClosed(client_host, client_port);
        return;
    }

    HTTP::HttpRequest request = HTTPRequestParser::parse(raw);
    logger.logRequest(request);

    // -------------------------------------------------------
    // STEP 2: Build and send the reply
    // -------------------------------------------------------
    sendResponse(client_fd, logger, respond(request));
    logger.logConnectionClosed(client_host, client_port);
}

void HTTPServer::sendResponse(int client_fd, Logger& logger, const HTTPResponse& reply) {
    std::string response = reply.build();
    logger.logResponse(response);

    if (!NetworkUtils::sendData(client_fd, response)) {
        logger.logError("Failed to send response: " + NetworkUtils::getLastError());
    }
}

// ====================================================================================================
// Response Selection
// ====================================================================================================
HTTPResponse HTTPServer::respond(const HTTP::HttpRequest& request) {
    if (request.method == HTTP::Method::UNINITIALIZED) {
        return ErrorResponseBuilder::build400BadRequest("Unrecognized request method");
    }

    if (request.version == HTTP::Version::UNINITIALIZED) {
        return ErrorResponseBuilder::build(StatusCodes::HTTP_VERSION_NOT_SUPPORTED, "Unrecognized HTTP version");
    }

    HTTPResponse response = HTTPResponse::ok(describe(request));
    response.setHeader("Connection", "close");

    if (request.method == HTTP::Method::HEAD) {
        response.setBody("");  // Content-Length still describes the GET body
    }

    return response;
}

std::string HTTPServer::describe(const HTTP::HttpRequest& request) {
    std::string out = fmt::format("method: {}\nresource: {}\nversion: {}\nheaders:\n",
                                  HTTP::toString(request.method),
                                  request.resource.path,
                                  HTTP::toString(request.version));

    for (const auto& [key, value] : request.headers) {
        out += fmt::format("  {}: {}\n", key, value);
    }

    out += fmt::format("body ({} bytes):\n{}", request.msg_body.size(), request.msg_body);
    return out;
}
