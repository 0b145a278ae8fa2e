#include "HTTPResponse.hpp"
#include "StatusCodes.hpp"

#include <algorithm>
#include <fmt/format.h>

// ====================================================================================================
// Construction & Mutators
// ====================================================================================================

HTTPResponse::HTTPResponse()
    : version_{"HTTP/1.1"}, status_code_{StatusCodes::OK}, status_text_{"OK"} {}

HTTPResponse& HTTPResponse::setVersion(std::string version) {
    version_ = std::move(version);
    return *this;
}

HTTPResponse& HTTPResponse::setStatus(int code, std::string text) {
    status_code_ = code;
    status_text_ = std::move(text);
    return *this;
}

HTTPResponse& HTTPResponse::setStatus(int code) {
    return setStatus(code, StatusCodes::reasonPhrase(code));
}

HTTPResponse& HTTPResponse::setHeader(const std::string& key, std::string value) {
    auto it = std::find_if(headers_.begin(), headers_.end(),
                           [&key](const Header& h) { return h.first == key; });
    if (it != headers_.end()) {
        it->second = std::move(value);
    } else {
        headers_.emplace_back(key, std::move(value));
    }
    return *this;
}

HTTPResponse& HTTPResponse::setBody(std::string body) {
    body_ = std::move(body);
    return *this;
}

HTTPResponse& HTTPResponse::setContentLength() {
    return setHeader("Content-Length", std::to_string(body_.size()));
}

std::string HTTPResponse::getHeader(const std::string& key) const {
    for (const auto& [name, value] : headers_) {
        if (name == key) return value;
    }
    return "";
}

// ====================================================================================================
// Serialization
// ====================================================================================================

std::string HTTPResponse::build() const {
    std::string response = fmt::format("{} {} {}\r\n", version_, status_code_, status_text_);

    for (const auto& [key, value] : headers_) {
        response += fmt::format("{}: {}\r\n", key, value);
    }

    response += "\r\n";
    response += body_;
    return response;
}

// ====================================================================================================
// Status Factories
// ====================================================================================================

HTTPResponse HTTPResponse::withStatus(int code, std::string body) {
    HTTPResponse response;
    response.setStatus(code)
            .setHeader("Content-Type", "text/plain")
            .setBody(std::move(body))
            .setContentLength();
    return response;
}

HTTPResponse HTTPResponse::ok(std::string body) {
    return withStatus(StatusCodes::OK, std::move(body));
}

HTTPResponse HTTPResponse::created(std::string body) {
    return withStatus(StatusCodes::CREATED, std::move(body));
}

HTTPResponse HTTPResponse::noContent() {
    return withStatus(StatusCodes::NO_CONTENT);
}

HTTPResponse HTTPResponse::badRequest(std::string body) {
    return withStatus(StatusCodes::BAD_REQUEST, std::move(body));
}

HTTPResponse HTTPResponse::notFound(std::string body) {
    return withStatus(StatusCodes::NOT_FOUND, std::move(body));
}

HTTPResponse HTTPResponse::methodNotAllowed(std::string body) {
    return withStatus(StatusCodes::METHOD_NOT_ALLOWED, std::move(body));
}

HTTPResponse HTTPResponse::internalServerError(std::string body) {
    return withStatus(StatusCodes::INTERNAL_SERVER_ERROR, std::move(body));
}
