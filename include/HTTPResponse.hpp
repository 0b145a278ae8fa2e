#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <utility>
#include <vector>

/**
 * HTTPResponse - Builds the text of an HTTP response
 * 
 * Responsibilities:
 * - Hold the status line (version, code, text), headers and body
 * - Serialize them into a single response string
 * 
 * Headers keep insertion order so build() output is byte-for-byte reproducible.
 * Setting an existing header replaces its value in place.
 */
class HTTPResponse {
public:
    using Header = std::pair<std::string, std::string>;

    /**
     * Default response: "HTTP/1.1 200 OK", no headers, empty body
     */
    HTTPResponse();

    /**
     * Set the protocol token of the status line
     * 
     * @param version e.g. "HTTP/1.1"
     * @return *this, for chaining
     */
    HTTPResponse& setVersion(std::string version);

    /**
     * Set status code and reason text
     * 
     * @param code HTTP status code
     * @param text Reason text written verbatim after the code
     * @return *this, for chaining
     */
    HTTPResponse& setStatus(int code, std::string text);

    /**
     * Set status code, taking the reason text from StatusCodes::reasonPhrase
     * 
     * @param code HTTP status code (unknown codes get an empty reason)
     * @return *this, for chaining
     */
    HTTPResponse& setStatus(int code);

    /**
     * Add a header, or replace the value of an existing one in place
     * 
     * @param key Header name (exact match)
     * @param value Header value
     * @return *this, for chaining
     */
    HTTPResponse& setHeader(const std::string& key, std::string value);

    /**
     * Replace the body; Content-Length is not updated
     * 
     * @param body Response body, written verbatim
     * @return *this, for chaining
     */
    HTTPResponse& setBody(std::string body);

    /**
     * Set Content-Length to the size of the current body
     */
    HTTPResponse& setContentLength();

    // Accessors
    const std::string& version() const { return version_; }
    int statusCode() const { return status_code_; }
    const std::string& statusText() const { return status_text_; }
    const std::vector<Header>& headers() const { return headers_; }
    const std::string& body() const { return body_; }

    /**
     * @param key Header name (exact match)
     * @return Header value, or empty string if not set
     */
    std::string getHeader(const std::string& key) const;

    /**
     * Serialize the response
     * 
     * Format: "<version> <code> <text>\r\n" + "<key>: <value>\r\n"... + "\r\n" + body
     * No headers are added implicitly; the body is written verbatim.
     * 
     * @return Complete HTTP response
     */
    std::string build() const;

    /**
     * Response with the given status, a text/plain body and its Content-Length
     * 
     * @param code HTTP status code
     * @param body Response body
     */
    static HTTPResponse withStatus(int code, std::string body = "");

    static HTTPResponse ok(std::string body = "");
    static HTTPResponse created(std::string body = "");
    static HTTPResponse noContent();
    static HTTPResponse badRequest(std::string body = "");
    static HTTPResponse notFound(std::string body = "");
    static HTTPResponse methodNotAllowed(std::string body = "");
    static HTTPResponse internalServerError(std::string body = "");

private:
    std::string version_;
    int status_code_;
    std::string status_text_;
    std::vector<Header> headers_;
    std::string body_;
};

#endif // HTTP_RESPONSE_HPP
