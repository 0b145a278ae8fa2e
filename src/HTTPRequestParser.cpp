#include "HTTPRequestParser.hpp"
#include <array>
#include <stdexcept>
#include "StringUtils.hpp"

using namespace utils;

namespace {
    constexpr std::string_view CRLF = "\r\n";
}

// ============================================================================
// Public Methods
// ============================================================================

HTTP::HttpRequest HTTPRequestParser::parse(const std::string& raw) {
    HTTP::HttpRequest request;
    request.resource = HTTP::Resource::Path("");

    const std::string_view input{raw};

    // Step 1: Request line
    size_t line_end = input.find(CRLF);
    if (line_end == std::string_view::npos) {
        parseRequestLine(input, request);
        return request;
    }
    parseRequestLine(input.substr(0, line_end), request);

    // Step 2: Header lines, up to the first blank line
    size_t pos = line_end + CRLF.size();
    while (pos < input.size()) {
        line_end = input.find(CRLF, pos);

        if (line_end == std::string_view::npos) {
            // Last line has no terminator, so there is no body
            parseHeaderLine(input.substr(pos), request.headers);
            break;
        }

        if (line_end == pos) {
            // Step 3: Blank line. The rest is the body, CRLFs included
            request.msg_body = std::string{input.substr(pos + CRLF.size())};
            break;
        }

        parseHeaderLine(input.substr(pos, line_end - pos), request.headers);
        pos = line_end + CRLF.size();
    }

    return request;
}

std::string HTTPRequestParser::getHeader(const HTTP::HttpRequest& request,
                                          const std::string& header_name) {
    // Exact match first, then fall back to a case-insensitive scan
    auto it = request.headers.find(header_name);
    if (it != request.headers.end()) {
        return it->second;
    }

    std::string lower_name = toLower(header_name);
    for (const auto& [key, value] : request.headers) {
        if (toLower(key) == lower_name) {
            return value;
        }
    }

    return "";
}

size_t HTTPRequestParser::getContentLength(const HTTP::HttpRequest& request) {
    std::string value = getHeader(request, "Content-Length");
    
    if (value.empty()) {
        return 0;
    }

    try {
        return static_cast<size_t>(std::stoul(value));
    } catch (const std::invalid_argument&) {
        return 0;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

// ============================================================================
// Private Helper Methods
// ============================================================================

void HTTPRequestParser::parseRequestLine(std::string_view line, HTTP::HttpRequest& request) {
    std::array<std::string_view, 3> tokens{};
    size_t count = 0;
    size_t start = 0;

    while (count < tokens.size()) {
        size_t space = line.find(' ', start);
        tokens[count++] = line.substr(start, space == std::string_view::npos ? space : space - start);
        if (space == std::string_view::npos) {
            break;
        }
        start = space + 1;
    }

    request.method = HTTP::toMethod(tokens[0]);
    request.resource = HTTP::Resource::Path(std::string{tokens[1]});
    request.version = HTTP::toVersion(tokens[2]);
}

void HTTPRequestParser::parseHeaderLine(std::string_view line,
                                        std::map<std::string, std::string>& headers) {
    size_t colon = line.find(':');
    if (colon == std::string_view::npos) {
        return;  // Not a header, drop it
    }

    std::string_view key = trim(line.substr(0, colon));
    if (key.empty()) {
        return;
    }

    headers.insert_or_assign(std::string{key}, std::string{trim(line.substr(colon + 1))});
}
