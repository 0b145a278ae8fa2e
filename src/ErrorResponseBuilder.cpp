#include "ErrorResponseBuilder.hpp"
#include "StatusCodes.hpp"
#include <sstream>

// ====================================================================================================
// Public Methods - Error Response Builders
// ====================================================================================================

HTTPResponse ErrorResponseBuilder::build(int status_code, const std::string& reason) {
    std::string heading = StatusCodes::reasonPhrase(status_code);
    if (heading.empty()) {
        heading = "Error";
    }

    std::string message = (status_code >= 500)
        ? "The server failed to handle your request."
        : "Your request could not be handled by the server.";
    if (!reason.empty()) {
        message += " Reason: " + reason;
    }

    std::string color;
    if (status_code == StatusCodes::BAD_REQUEST) color = "#e91e63";              // Pink
    else if (status_code == StatusCodes::NOT_FOUND) color = "#9c27b0";           // Purple
    else if (status_code == StatusCodes::METHOD_NOT_ALLOWED) color = "#f57c00";  // Orange
    else color = "#d32f2f";                                                      // Red

    HTTPResponse response;
    response.setStatus(status_code, heading)
            .setHeader("Content-Type", "text/html; charset=UTF-8")
            .setBody(buildErrorHTML(status_code, heading, message, color))
            .setContentLength()
            .setHeader("Connection", "close");
    return response;
}

HTTPResponse ErrorResponseBuilder::build400BadRequest(const std::string& reason) {
    return build(StatusCodes::BAD_REQUEST, reason);
}

HTTPResponse ErrorResponseBuilder::build404NotFound(const std::string& reason) {
    return build(StatusCodes::NOT_FOUND, reason);
}

HTTPResponse ErrorResponseBuilder::build405MethodNotAllowed(const std::string& reason) {
    return build(StatusCodes::METHOD_NOT_ALLOWED, reason);
}

HTTPResponse ErrorResponseBuilder::build500InternalServerError(const std::string& reason) {
    return build(StatusCodes::INTERNAL_SERVER_ERROR, reason);
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

std::string ErrorResponseBuilder::buildErrorHTML(int error_code,
                                                 const std::string& heading,
                                                 const std::string& message,
                                                 const std::string& color) {
    std::ostringstream html;

    html << "<!DOCTYPE html>\n"
         << "<html lang=\"en\">\n"
         << "<head>\n"
         << "  <meta charset=\"UTF-8\">\n"
         << "  <title>" << error_code << " " << htmlEscape(heading) << "</title>\n"
         << "  <style>\n"
         << "    body { font-family: Arial, sans-serif; background: #f5f5f5; padding: 20px; }\n"
         << "    .header { background: " << color << "; color: white; padding: 30px; text-align: center; }\n"
         << "    .error-code { font-size: 72px; font-weight: bold; }\n"
         << "    .message { padding: 30px; font-size: 16px; color: #333; }\n"
         << "  </style>\n"
         << "</head>\n"
         << "<body>\n"
         << "  <div class=\"header\">\n"
         << "    <div class=\"error-code\">" << error_code << "</div>\n"
         << "    <div class=\"error-title\">" << htmlEscape(heading) << "</div>\n"
         << "  </div>\n"
         << "  <div class=\"message\">" << htmlEscape(message) << "</div>\n"
         << "</body>\n"
         << "</html>";

    return html.str();
}

std::string ErrorResponseBuilder::htmlEscape(const std::string& text) {
    std::ostringstream escaped;

    for (char c : text) {
        switch (c) {
            case '<':
                escaped << "&lt;";
                break;
            case '>':
                escaped << "&gt;";
                break;
            case '&':
                escaped << "&amp;";
                break;
            case '"':
                escaped << "&quot;";
                break;
            case '\'':
                escaped << "&#39;";
                break;
            default:
                escaped << c;
                break;
        }
    }

    return escaped.str();
}
