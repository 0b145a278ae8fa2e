#ifndef HTTP_REQUEST_PARSER_HPP
#define HTTP_REQUEST_PARSER_HPP

#include <map>
#include <string>
#include <string_view>

#include "HTTPMessage.hpp"

/**
 * HTTPRequestParser - Turns a raw HTTP/1.x request into an HTTP::HttpRequest
 * 
 * Responsibilities:
 * - Split the request line into method, resource path and version
 * - Split header lines into a key/value map
 * - Extract the message body that follows the first blank line
 * 
 * Parsing never fails: anything missing or malformed falls back to a default.
 * The parser performs no I/O; callers read the raw bytes themselves.
 */
class HTTPRequestParser {
public:
    /**
     * Parse a complete HTTP request
     * 
     * Expected shape: REQUEST-LINE CRLF *(HEADER-LINE CRLF) CRLF [BODY]
     * 
     * Fallbacks:
     * - Unknown or missing method  -> Method::UNINITIALIZED
     * - Missing resource           -> Resource::Path("")
     * - Unknown or missing version -> Version::UNINITIALIZED
     * - Header line without ':'    -> dropped
     * - Missing body               -> ""
     * 
     * @param raw Raw request text using CRLF line endings
     * @return Fully populated request
     */
    static HTTP::HttpRequest parse(const std::string& raw);

    /**
     * Extract the value of a specific header (case-insensitive)
     * 
     * @param request Parsed request
     * @param header_name Name of header to find (e.g., "Content-Length")
     * @return Header value, or empty string if not found
     */
    static std::string getHeader(const HTTP::HttpRequest& request, const std::string& header_name);

    /**
     * Helper: Parse Content-Length from headers
     * 
     * @param request Parsed request
     * @return Content length, or 0 if not present or not a number
     */
    static size_t getContentLength(const HTTP::HttpRequest& request);

private:
    /**
     * Split "METHOD PATH VERSION" on single spaces into the request fields.
     * Tokens past the third are ignored.
     */
    static void parseRequestLine(std::string_view line, HTTP::HttpRequest& request);

    /**
     * Split "Key: Value" on the first colon; both sides are trimmed.
     * Later keys overwrite earlier ones.
     */
    static void parseHeaderLine(std::string_view line, std::map<std::string, std::string>& headers);
};

#endif // HTTP_REQUEST_PARSER_HPP
