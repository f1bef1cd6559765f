#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "ws2_32.lib")
    typedef SOCKET socket_t;
    #define INVALID_SOCKET_VALUE INVALID_SOCKET
    #define SOCKET_ERROR_VALUE SOCKET_ERROR
#else
    #include <sys/socket.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <unistd.h>
    typedef int socket_t;
    #define INVALID_SOCKET_VALUE -1
    #define SOCKET_ERROR_VALUE -1
    #define closesocket close
#endif

namespace peerdrop {

// Socket Library Initialization
/**
 * Initialize the socket library
 * @return true if successful, false otherwise
 */
bool init_socket_library();

/**
 * Cleanup the socket library
 */
void cleanup_socket_library();

// TCP Socket Functions
/**
 * Create a TCP client socket and connect to an IPv4 server
 * @param host The hostname or IPv4 address to connect to
 * @param port The port number to connect to
 * @param timeout_ms Connection timeout in milliseconds (0 = blocking connect)
 * @return Connected socket, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms = 0);

/**
 * Create a TCP server socket listening on IPv4
 * @param port The port to listen on, 0 for an ephemeral port
 * @param backlog The maximum number of pending connections
 * @param bind_address Local address to bind, empty for all interfaces
 * @return Listening socket, or INVALID_SOCKET_VALUE on error
 */
socket_t create_tcp_server_v4(int port, int backlog = 5, const std::string& bind_address = "");

/**
 * Accept a pending connection on a listening socket
 * @return Client socket, or INVALID_SOCKET_VALUE on error
 */
socket_t accept_client(socket_t server_socket);

/**
 * Wait until a socket has data (or a pending connection)
 * @param timeout_ms Maximum wait, negative waits forever
 * @return 1 if readable, 0 on timeout, -1 on error
 */
int wait_for_readable(socket_t socket, int timeout_ms);

/**
 * Get the "ip:port" of the remote end
 */
std::string get_peer_address(socket_t socket);

/**
 * Get the locally bound port (useful after binding to port 0)
 * @return Port number, or -1 on error
 */
int get_ephemeral_port(socket_t socket);

/**
 * Send every byte of a buffer, looping over partial sends
 * @return true if all bytes were written
 */
bool send_all(socket_t socket, const uint8_t* data, size_t size);

/**
 * Receive exactly num_bytes bytes
 * @return false on error or if the peer closed the connection first
 */
bool receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes);

/**
 * Close a socket
 * @param socket The socket to close
 */
void close_socket(socket_t socket);

/**
 * Shut down both directions, waking any thread blocked on the socket
 */
void shutdown_socket(socket_t socket);

bool is_valid_socket(socket_t socket);
bool set_socket_nonblocking(socket_t socket);
bool set_socket_blocking(socket_t socket);
bool set_tcp_nodelay(socket_t socket);

} // namespace peerdrop
