#include "ServerConfig.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

#include "StringUtils.hpp"

using namespace utils;

// ====================================================================================================
// Public Methods
// ====================================================================================================

bool ServerConfig::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "[ServerConfig] Failed to open " << filename << "\n";
        return false;
    }

    std::string line;
    int line_number = 0;

    while (std::getline(file, line)) {
        ++line_number;

        // Tolerate CRLF files
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string_view entry = trim(line);

        // Skip empty lines and comments
        if (entry.empty() || entry[0] == '#') {
            continue;
        }

        size_t equals = entry.find('=');
        if (equals == std::string_view::npos) {
            std::cerr << "[ServerConfig] " << filename << ":" << line_number
                      << ": expected key = value\n";
            continue;
        }

        std::string key{trim(entry.substr(0, equals))};
        std::string value{trim(entry.substr(equals + 1))};

        if (!set(key, value)) {
            std::cerr << "[ServerConfig] " << filename << ":" << line_number
                      << ": ignoring '" << key << "'\n";
        }
    }

    return true;
}

bool ServerConfig::applyArgs(const std::vector<std::string>& args) {
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& option = args[i];

        if (i + 1 >= args.size()) {
            std::cerr << "[ServerConfig] Missing value for " << option << "\n";
            return false;
        }
        const std::string& value = args[++i];

        if (option == "--config") {
            if (!loadFromFile(value)) return false;
        } else if (option == "--port") {
            if (!set("port", value)) return false;
        } else if (option == "--log") {
            if (!set("log_file", value)) return false;
        } else {
            std::cerr << "[ServerConfig] Unknown option: " << option << "\n";
            return false;
        }
    }

    return true;
}

// ====================================================================================================
// Private Helper Methods
// ====================================================================================================

bool ServerConfig::set(const std::string& key, const std::string& value) {
    if (key == "port") {
        int parsed;
        if (!parsePositive(value, parsed) || parsed > 65535) {
            std::cerr << "[ServerConfig] Invalid port number: " << value << "\n";
            return false;
        }
        port = parsed;
        return true;
    }

    if (key == "log_file") {
        if (value.empty()) {
            std::cerr << "[ServerConfig] log_file must not be empty\n";
            return false;
        }
        log_file = value;
        return true;
    }

    if (key == "read_timeout_seconds") {
        int parsed;
        if (!parsePositive(value, parsed)) {
            std::cerr << "[ServerConfig] Invalid timeout: " << value << "\n";
            return false;
        }
        read_timeout_seconds = parsed;
        return true;
    }

    if (key == "max_header_bytes" || key == "max_body_bytes") {
        int parsed;
        if (!parsePositive(value, parsed)) {
            std::cerr << "[ServerConfig] Invalid size for " << key << ": " << value << "\n";
            return false;
        }
        if (key == "max_header_bytes") {
            max_header_bytes = static_cast<size_t>(parsed);
        } else {
            max_body_bytes = static_cast<size_t>(parsed);
        }
        return true;
    }

    return false;
}

bool ServerConfig::parsePositive(const std::string& value, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed <= 0) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}
