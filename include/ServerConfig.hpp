#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <cstddef>
#include <string>
#include <vector>

/**
 * ServerConfig - Settings for the echo server
 * 
 * Responsibilities:
 * - Hold defaults for port, log file, socket read timeout and request size limits
 * - Load "key = value" settings from a configuration file
 * - Apply command line overrides (--port, --config, --log)
 */
class ServerConfig {
public:
    int port = 8080;
    std::string log_file = "logs/log.txt";
    int read_timeout_seconds = 5;
    size_t max_header_bytes = 64 * 1024;    // Request line + headers + blank line
    size_t max_body_bytes = 1024 * 1024;    // Largest accepted Content-Length

    /**
     * Load settings from file
     * 
     * Lines are "key = value"; blank lines and lines starting with '#' are skipped.
     * Unknown keys and malformed values are reported and leave the setting unchanged.
     * 
     * @param filename Path to configuration file
     * @return true on success, false if the file cannot be opened
     */
    bool loadFromFile(const std::string& filename);

    /**
     * Apply command line options, in order
     * 
     * --config FILE is loaded at the point it appears, so options after it win.
     * 
     * @param args Arguments following the mode name
     * @return true on success, false on an unknown option or bad value
     */
    bool applyArgs(const std::vector<std::string>& args);

private:
    /**
     * Apply a single setting
     * @return true if the key is known and the value valid
     */
    bool set(const std::string& key, const std::string& value);

    /**
     * Parse a positive integer
     * @return true on success
     */
    static bool parsePositive(const std::string& value, int& out);
};

#endif // SERVER_CONFIG_HPP
