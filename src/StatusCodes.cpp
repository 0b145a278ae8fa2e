#include "StatusCodes.hpp"

namespace StatusCodes {

    std::string reasonPhrase(int code) {
        switch (code) {
            // 1xx Informational
            case 100: return "Continue";
            case 101: return "Switching Protocols";
            case 103: return "Early Hints";

            // 2xx Success
            case 200: return "OK";
            case 201: return "Created";
            case 202: return "Accepted";
            case 203: return "Non-Authoritative Information";
            case 204: return "No Content";
            case 205: return "Reset Content";
            case 206: return "Partial Content";

            // 3xx Redirection
            case 302: return "Found";
            case 303: return "See Other";
            case 304: return "Not Modified";
            case 307: return "Temporary Redirect";
            case 308: return "Permanent Redirect";

            // 4xx Client Error
            case 400: return "Bad Request";
            case 401: return "Unauthorized";
            case 403: return "Forbidden";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 408: return "Request Timeout";
            case 410: return "Gone";
            case 413: return "Payload Too Large";
            case 418: return "I'm a teapot";
            case 431: return "Request Header Fields Too Large";

            // 5xx Server Error
            case 500: return "Internal Server Error";
            case 501: return "Not Implemented";
            case 502: return "Bad Gateway";
            case 503: return "Service Unavailable";
            case 505: return "HTTP Version Not Supported";

            default:  return "";
        }
    }

} // namespace StatusCodes
