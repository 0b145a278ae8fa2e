#include "Logger.hpp"
#include <chrono>
#include <iostream>
#include <fmt/chrono.h>
#include <fmt/format.h>

#include <filesystem>   
#include <fstream>      
#include <mutex> 

#include <string>       

// Serialize concurrent file writes across all Logger instances
static std::mutex g_log_file_mutex;

// Sanitize a log line (trim CRLF, keep printable ASCII/whitespace, redact Basic auth, cap length)
static std::string sanitize_http_line(std::string s) {
    // Trim at first CRLF
    if (auto p = s.find("\r\n"); p != std::string::npos)
        s.erase(p);

    // Keep only printable ASCII and tab
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 32 && c <= 126) || c == '\t')
            out.push_back(static_cast<char>(c));
        // drop other control/binary
    }

    // Redact Basic auth if present
    auto redact = [&](const char* key){
        std::string k = key;
        auto pos = out.find(k);
        if (pos != std::string::npos) {
            auto val_start = pos + k.size();
            // skip whitespace
            while (val_start < out.size() &&
                   (out[val_start] == ' ' || out[val_start] == '\t'))
                ++val_start;
            // redact the rest of line
            out.replace(val_start, out.size() - val_start, "[REDACTED]");
        }
    };
    redact("Authorization: Basic");
    redact("Proxy-Authorization: Basic");

    // Cap length
    constexpr size_t kMax = 512;
    if (out.size() > kMax) {
        out.resize(kMax);
        out += "...";
    }
    return out;
}


// Create a new logger object for the given client
Logger::Logger(std::string clientID, std::string logfile)
    : clientID(std::move(clientID)), logfile(std::move(logfile)) {

    // Ensure the log directory exists (safe if it already exists)
    std::filesystem::path parent = std::filesystem::path(this->logfile).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "[Logger] ERROR: cannot create " << parent << ": " << ec.message() << "\n";
        }
    }
}

const std::string Logger::getTime(){
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", std::chrono::system_clock::now());
}

void Logger::logRequest(const HTTP::HttpRequest& request){
    // Rebuild the request line from the parsed fields, then sanitize it
    const std::string clean = sanitize_http_line(fmt::format("{} {} {}",
        HTTP::toString(request.method), request.resource.path, HTTP::toString(request.version)));

    std::string log = fmt::format("{} [{}]: Request: {}", getTime(), clientID, clean);
    std::cout << log << std::endl;
    logToFile(log);
}

void Logger::logResponse(const std::string& response){
    // Sanitize the status line before logging
    const std::string clean = sanitize_http_line(response);

    std::string log = fmt::format("{} [{}]: Response: {}", getTime(), clientID, clean);
    std::cout << log << std::endl;
    logToFile(log);
}

void Logger::logConnectionOpened(const std::string& host, int port){
    logToFile(fmt::format("{} [{}]: Connection opened from {}:{}", getTime(), clientID, host, port));
}
void Logger::logConnectionClosed(const std::string& host, int port){
    logToFile(fmt::format("{} [{}]: Connection closed for {}:{}", getTime(), clientID, host, port));
}
void Logger::logCustomMsg(const std::string& entry){
    logToFile(fmt::format("{} [{}]: {}", getTime(), clientID, sanitize_http_line(entry)));
}

void Logger::logError(const std::string& entry){
    std::string log = fmt::format("{} [{}]: ERROR: {}", getTime(), clientID, sanitize_http_line(entry));
    std::cerr << log << std::endl;
    logToFile(log);
}


void Logger::logToFile(const std::string& entry){
    // One log file shared by all clients
    std::lock_guard<std::mutex> lock(g_log_file_mutex); //Guard concurrent appends.

    std::ofstream out(logfile, std::ios::app); //Open in append mode
    if (!out){
        std::cerr << "[Logger] ERROR: cannot open " << logfile << "\n";
        return;
    }
    out << entry << '\n';
}
