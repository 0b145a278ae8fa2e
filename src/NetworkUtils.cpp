#include "NetworkUtils.hpp"
#include "HTTPRequestParser.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>

namespace {
    constexpr std::string_view HEADER_TERMINATOR = "\r\n\r\n";
    constexpr size_t READ_CHUNK = 8192;
}

// ====================================================================================================
// Request Reading
// ====================================================================================================

NetworkUtils::ReadStatus NetworkUtils::readRequest(int fd, const ReadLimits& limits, std::string& request) {
    request.clear();

    size_t header_end = 0;
    ReadStatus status = readHeaders(fd, limits.max_header_bytes, request, header_end);
    if (status != ReadStatus::OK) {
        return status;
    }

    // Only the header block decides the body length
    size_t content_length = HTTPRequestParser::getContentLength(
        HTTPRequestParser::parse(request.substr(0, header_end)));

    if (content_length > limits.max_body_bytes) {
        return ReadStatus::BODY_TOO_LARGE;
    }

    size_t already_have = request.size() - header_end;
    if (already_have >= content_length) {
        request.resize(header_end + content_length);
        return ReadStatus::OK;
    }

    request.reserve(header_end + content_length);
    if (!readExact(fd, content_length - already_have, request)) {
        std::cerr << "[NetworkUtils] Incomplete request body\n";
        return ReadStatus::INCOMPLETE_BODY;
    }

    return ReadStatus::OK;
}

NetworkUtils::ReadStatus NetworkUtils::readHeaders(int fd, size_t max_bytes,
                                                   std::string& headers, size_t& header_end) {
    char buf[READ_CHUNK];

    while (true) {
        ssize_t n = receiveSome(fd, buf, sizeof(buf));
        if (n <= 0) {
            return ReadStatus::CLOSED;
        }

        // Only the new bytes (plus 3 for a split terminator) need searching
        size_t search_from = headers.size() >= 3 ? headers.size() - 3 : 0;
        headers.append(buf, n);

        size_t pos = headers.find(HEADER_TERMINATOR, search_from);
        if (pos != std::string::npos) {
            header_end = pos + HEADER_TERMINATOR.size();
            return header_end > max_bytes ? ReadStatus::HEADERS_TOO_LARGE : ReadStatus::OK;
        }

        if (headers.size() > max_bytes) {
            return ReadStatus::HEADERS_TOO_LARGE;
        }
    }
}

bool NetworkUtils::readExact(int fd, size_t n, std::string& out) {
    char buf[READ_CHUNK];

    while (n > 0) {
        ssize_t got = receiveSome(fd, buf, std::min(sizeof(buf), n));
        if (got <= 0) {
            return false;
        }
        out.append(buf, got);
        n -= static_cast<size_t>(got);
    }

    return true;
}

ssize_t NetworkUtils::receiveSome(int fd, char* buffer, size_t max_length) {
    ssize_t received;
    do {
        received = recv(fd, buffer, max_length, 0);
    } while (received < 0 && errno == EINTR);

    if (received < 0) {
        std::cerr << "[NetworkUtils] Receive failed: " << strerror(errno) << "\n";
    }
    return received;
}

// ====================================================================================================
// Writing & Socket Options
// ====================================================================================================

bool NetworkUtils::sendData(int fd, const std::string& data) {
    size_t total_sent = 0;

    while (total_sent < data.size()) {
        ssize_t sent = send(fd, data.data() + total_sent, data.size() - total_sent, MSG_NOSIGNAL);
        if (sent < 0 && errno == EINTR) {
            continue;
        }
        if (sent <= 0) {
            std::cerr << "[NetworkUtils] Send failed: " << strerror(errno) << "\n";
            return false;
        }
        total_sent += static_cast<size_t>(sent);
    }

    return true;
}

bool NetworkUtils::setSocketTimeout(int fd, int seconds) {
    struct timeval timeout{};
    timeout.tv_sec = seconds;

    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
        std::cerr << "[NetworkUtils] Failed to set timeout: " << strerror(errno) << "\n";
        return false;
    }

    return true;
}

std::string NetworkUtils::getLastError() {
    return std::string(strerror(errno));
}
