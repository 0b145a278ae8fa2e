#ifndef STATUS_CODES_HPP
#define STATUS_CODES_HPP

#include <string>

namespace StatusCodes {

    constexpr int OK                    = 200;
    constexpr int CREATED               = 201;
    constexpr int NO_CONTENT            = 204;
    constexpr int BAD_REQUEST           = 400;
    constexpr int NOT_FOUND             = 404;
    constexpr int METHOD_NOT_ALLOWED    = 405;
    constexpr int PAYLOAD_TOO_LARGE     = 413;
    constexpr int REQUEST_HEADER_FIELDS_TOO_LARGE = 431;
    constexpr int INTERNAL_SERVER_ERROR = 500;
    constexpr int HTTP_VERSION_NOT_SUPPORTED = 505;

    /**
     * Standard reason phrase for a status code
     * 
     * @param code HTTP status code (200, 404, etc.)
     * @return Reason phrase (e.g., "Not Found"), or empty string if unknown
     */
    std::string reasonPhrase(int code);

} // namespace StatusCodes

#endif // STATUS_CODES_HPP
