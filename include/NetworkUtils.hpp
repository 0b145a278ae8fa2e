#ifndef NETWORK_UTILS_HPP
#define NETWORK_UTILS_HPP

#include <string>
#include <sys/types.h>

/**
 * NetworkUtils - Socket I/O for HTTP messages
 * 
 * Responsibilities:
 * - Read one complete HTTP request (headers + Content-Length body) within size limits
 * - Write a complete response, retrying partial sends
 * - Configure per-connection timeouts
 * 
 * This is a utility class with static methods only.
 */
class NetworkUtils {
public:
    /**
     * Outcome of readRequest
     */
    enum class ReadStatus {
        OK,
        CLOSED,             // Peer closed or socket error before the headers were complete
        HEADERS_TOO_LARGE,  // No blank line within max_header_bytes
        BODY_TOO_LARGE,     // Content-Length above max_body_bytes
        INCOMPLETE_BODY     // Peer closed before Content-Length bytes arrived
    };

    /**
     * Size limits applied while reading a request
     */
    struct ReadLimits {
        size_t max_header_bytes;
        size_t max_body_bytes;
    };

    /**
     * Read a complete HTTP request from a socket
     * 
     * Reads until "\r\n\r\n", then reads the remainder of the body announced by
     * Content-Length. Bytes past the body are discarded. Nothing larger than the
     * limits is ever buffered.
     * 
     * @param fd Socket file descriptor
     * @param limits Header block and body size caps
     * @param request Output: raw request text (valid only when OK is returned)
     * @return Read outcome
     */
    static ReadStatus readRequest(int fd, const ReadLimits& limits, std::string& request);

    /**
     * Send a complete string to a socket
     * 
     * Loops over partial sends; SIGPIPE is suppressed.
     * 
     * @param fd Socket file descriptor
     * @param data Data to send
     * @return true on success, false on failure
     */
    static bool sendData(int fd, const std::string& data);

    /**
     * Set both send and receive timeouts
     * 
     * @param fd Socket file descriptor
     * @param seconds Timeout in seconds
     * @return true on success, false on failure
     */
    static bool setSocketTimeout(int fd, int seconds);

    /**
     * @return Human-readable message for the current errno
     */
    static std::string getLastError();

private:
    /**
     * Helper: Read until the header block ends or max_bytes is passed
     * 
     * @param headers Output: everything received so far (may include body bytes)
     * @param header_end Output: offset just past "\r\n\r\n"
     */
    static ReadStatus readHeaders(int fd, size_t max_bytes, std::string& headers, size_t& header_end);

    /**
     * Helper: Append exactly n bytes from the socket to out
     * 
     * @return true if all n bytes arrived
     */
    static bool readExact(int fd, size_t n, std::string& out);

    /**
     * Helper: recv() retried on EINTR
     * 
     * @return Bytes received, 0 on EOF, -1 on error
     */
    static ssize_t receiveSome(int fd, char* buffer, size_t max_length);

    // Utility class - no instances allowed
    NetworkUtils() = delete;
};

#endif // NETWORK_UTILS_HPP
