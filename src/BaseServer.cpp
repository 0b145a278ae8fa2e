#include <iostream>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>
#include <pthread.h>

#include "BaseServer.hpp"
#include "NetworkUtils.hpp"


BaseServer::BaseServer(int port)
    : socket_fd{-1}, server_port{port} {}

BaseServer::~BaseServer() {
    if (socket_fd != -1) {
        close(socket_fd);
    }
}

bool BaseServer::start() {
    std::string error;
    if (!openListener(error)) {
        std::cerr << "[BaseServer] " << error << " on port " << server_port
                  << ": " << NetworkUtils::getLastError() << "\n";
        if (socket_fd != -1) {
            close(socket_fd);
            socket_fd = -1;
        }
        return false;
    }

    std::cout << "[BaseServer] Listening on port " << server_port << "\n";
    while (true) {
        auto* client = new ClientInfo{this, -1, "", 0};
        if (acceptConnection(*client) < 0) {
            delete client;
            continue; // Accept failed, try again
        }

        // The thread owns client and closes its socket
        pthread_t thread_id;
        if (pthread_create(&thread_id, nullptr, BaseServer::threadEntry, client) != 0) {
            std::cerr << "[BaseServer] Failed to create thread\n";
            close(client->fd);
            delete client;
            continue;
        }
        pthread_detach(thread_id);
    }
}

bool BaseServer::openListener(std::string& error) {
    socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        error = "Failed to create socket";
        return false;
    }

    int opt = 1;
    if (setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        error = "Failed to set SO_REUSEADDR";
        return false;
    }

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(server_port);

    if (bind(socket_fd, reinterpret_cast<sockaddr*>(&server_addr), sizeof(server_addr)) < 0) {
        error = "Failed to bind";
        return false;
    }

    if (listen(socket_fd, SOMAXCONN) < 0) {
        error = "Failed to listen";
        return false;
    }

    return true;
}

int BaseServer::acceptConnection(ClientInfo& client) {
    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);

    client.fd = accept(socket_fd, reinterpret_cast<sockaddr*>(&client_addr), &client_len);
    if (client.fd < 0) {
        std::cerr << "[BaseServer] Accept failed: " << NetworkUtils::getLastError() << "\n";
        return -1;
    }

    char host_buf[INET_ADDRSTRLEN] = {};
    client.host = inet_ntop(AF_INET, &client_addr.sin_addr, host_buf, sizeof(host_buf)) != nullptr
        ? host_buf : "unknown";
    client.port = ntohs(client_addr.sin_port);
    return client.fd;
}

void* BaseServer::threadEntry(void* arg) {
    auto* client = static_cast<ClientInfo*>(arg);

    client->server->handleRequest(client->fd, client->host, client->port);
    close(client->fd);

    delete client;
    return nullptr;
}
