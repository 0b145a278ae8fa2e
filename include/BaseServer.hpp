#ifndef BASE_SERVER_HPP
#define BASE_SERVER_HPP

#include <string>

/**
 * BaseServer - TCP accept loop with one detached thread per connection
 * 
 * Subclasses implement handleRequest; the connection is closed when it returns.
 */
class BaseServer{
public:
    BaseServer(int port);
    virtual ~BaseServer();

    /**
     * Bind, listen and serve connections until the process exits
     * 
     * @return false if the listening socket could not be set up
     */
    bool start();

protected:
    int socket_fd;
    int server_port;

    virtual void handleRequest(int client_fd, const std::string& client_host, int client_port) = 0;

private:
    struct ClientInfo {
        BaseServer* server;
        int fd;
        std::string host;
        int port;
    };

    /**
     * Create, bind and listen on server_port
     * 
     * @param error Output: failing step, for diagnostics
     * @return true once socket_fd is listening
     */
    bool openListener(std::string& error);

    /**
     * Accept one connection and fill in the peer address
     * 
     * @return Client socket, or -1 on failure
     */
    int acceptConnection(ClientInfo& client);

    static void* threadEntry(void* arg);
};

#endif // BASE_SERVER_HPP
