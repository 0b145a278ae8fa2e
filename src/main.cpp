#include <iostream>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "HTTPRequestParser.hpp"
#include "HTTPServer.hpp"
#include "ServerConfig.hpp"


static void printUsage(const char* program) {
    std::cerr << "Usage:\n";
    std::cerr << "  " << program << " serve [--port <port>] [--config <file>] [--log <file>]\n";
    std::cerr << "  " << program << " parse <request-file>\n";
}

int main(int argc, char* argv[]) {
    // Basic Argument Parsing
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    // Server Mode
    if (strcmp(argv[1], "serve") == 0) {
        ServerConfig config;
        if (!config.applyArgs(std::vector<std::string>(argv + 2, argv + argc))) {
            printUsage(argv[0]);
            return 1;
        }

        HTTPServer server(config);
        if (!server.start()) {
            return 1;
        }
    }

    // Parse Mode: parse a raw request stored in a file and describe it
    else if (strcmp(argv[1], "parse") == 0) {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " parse <request-file>\n";
            return 1;
        }

        std::ifstream file(argv[2], std::ios::binary);
        if (!file.is_open()) {
            std::cerr << "Cannot open request file: " << argv[2] << "\n";
            return 1;
        }

        std::ostringstream raw;
        raw << file.rdbuf();

        HTTP::HttpRequest request = HTTPRequestParser::parse(raw.str());
        std::cout << HTTPServer::describe(request) << "\n";
    }

    // Invalid Mode
    else {
        std::cerr << "Unknown mode: " << argv[1] << "\n";
        printUsage(argv[0]);
        return 1;
    }

    return 0;
}
