#ifndef ERROR_RESPONSE_BUILDER_HPP
#define ERROR_RESPONSE_BUILDER_HPP

#include <string>

#include "HTTPResponse.hpp"

/**
 * ErrorResponseBuilder - Generates HTTP error responses with small HTML pages
 * 
 * Responsibilities:
 * - Build complete HTTP error responses
 * - Generate HTML error pages
 * - Handle different error types (400, 404, 405, 500, etc.)
 */
class ErrorResponseBuilder {
public:
    /**
     * Build an error response for any status code
     * 
     * @param status_code HTTP status code
     * @param reason Optional detail shown on the page (HTML-escaped)
     * @return Response with HTML body, Content-Type, Content-Length and Connection: close
     */
    static HTTPResponse build(int status_code, const std::string& reason = "");

    /**
     * Build 400 Bad Request response
     * Used when the request line cannot be understood
     */
    static HTTPResponse build400BadRequest(const std::string& reason = "");

    /**
     * Build 404 Not Found response
     */
    static HTTPResponse build404NotFound(const std::string& reason = "");

    /**
     * Build 405 Method Not Allowed response
     */
    static HTTPResponse build405MethodNotAllowed(const std::string& reason = "");

    /**
     * Build 500 Internal Server Error response
     */
    static HTTPResponse build500InternalServerError(const std::string& reason = "");

private:
    /**
     * Generate HTML error page
     * 
     * @param error_code HTTP status code (400, 404, etc.)
     * @param heading Reason phrase for the code
     * @param message Primary error message
     * @param color Theme color for the error page
     * @return Complete HTML page
     */
    static std::string buildErrorHTML(int error_code,
                                      const std::string& heading,
                                      const std::string& message,
                                      const std::string& color);

    /**
     * HTML escape a string to prevent XSS
     * Converts: < > & " ' to their HTML entities
     * 
     * @param text Text to escape
     * @return HTML-safe text
     */
    static std::string htmlEscape(const std::string& text);
};

#endif // ERROR_RESPONSE_BUILDER_HPP
