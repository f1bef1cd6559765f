#include "socket.h"
#include "network_utils.h"
#include "logger.h"
#include <algorithm>
#include <cstring>
#ifndef _WIN32
    #include <fcntl.h>
    #include <errno.h>
    #include <poll.h>
    #include <netinet/tcp.h>
#endif

#define LOG_SOCKET_DEBUG(message) LOG_DEBUG("socket", message)
#define LOG_SOCKET_INFO(message)  LOG_INFO("socket", message)
#define LOG_SOCKET_WARN(message)  LOG_WARN("socket", message)
#define LOG_SOCKET_ERROR(message) LOG_ERROR("socket", message)

#ifdef MSG_NOSIGNAL
    #define PEERDROP_SEND_FLAGS MSG_NOSIGNAL
#else
    #define PEERDROP_SEND_FLAGS 0
#endif

namespace peerdrop {

namespace {

int last_socket_error() {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

bool connect_in_progress(int error) {
#ifdef _WIN32
    return error == WSAEWOULDBLOCK;
#else
    return error == EINPROGRESS;
#endif
}

bool interrupted(int error) {
#ifdef _WIN32
    (void)error;
    return false;
#else
    return error == EINTR;
#endif
}

bool connect_with_timeout(socket_t socket, struct sockaddr* addr, socklen_t addr_len, int timeout_ms) {
    if (!set_socket_nonblocking(socket)) {
        return false;
    }

    if (connect(socket, addr, addr_len) == SOCKET_ERROR_VALUE) {
        int error = last_socket_error();
        if (!connect_in_progress(error)) {
            LOG_SOCKET_DEBUG("connect() failed immediately: " << error);
            return false;
        }

#ifdef _WIN32
        WSAPOLLFD pfd;
        pfd.fd = socket;
        pfd.events = POLLWRNORM;
        int ready = WSAPoll(&pfd, 1, timeout_ms);
#else
        struct pollfd pfd;
        pfd.fd = socket;
        pfd.events = POLLOUT;
        int ready = poll(&pfd, 1, timeout_ms);
#endif
        if (ready <= 0) {
            LOG_SOCKET_DEBUG((ready == 0 ? "Connection timed out" : "poll() failed during connect"));
            return false;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(socket, SOL_SOCKET, SO_ERROR, (char*)&so_error, &len) == SOCKET_ERROR_VALUE || so_error != 0) {
            LOG_SOCKET_DEBUG("Connection failed: " << so_error);
            return false;
        }
    }

    return set_socket_blocking(socket);
}

} // namespace

bool init_socket_library() {
#ifdef _WIN32
    WSADATA wsaData;
    int result = WSAStartup(MAKEWORD(2, 2), &wsaData);
    if (result != 0) {
        LOG_SOCKET_ERROR("WSAStartup failed: " << result);
        return false;
    }
    LOG_SOCKET_DEBUG("Windows Socket API initialized");
#endif
    return true;
}

void cleanup_socket_library() {
#ifdef _WIN32
    WSACleanup();
    LOG_SOCKET_DEBUG("Windows Socket API cleaned up");
#endif
}

socket_t create_tcp_client_v4(const std::string& host, int port, int timeout_ms) {
    LOG_SOCKET_DEBUG("Creating TCP client socket for " << host << ":" << port);

    if (port <= 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 1-65535)");
        return INVALID_SOCKET_VALUE;
    }

    std::string resolved_ip = network_utils::resolve_hostname(host);
    if (resolved_ip.empty()) {
        LOG_SOCKET_ERROR("Failed to resolve hostname: " << host);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, resolved_ip.c_str(), &server_addr.sin_addr) <= 0) {
        LOG_SOCKET_ERROR("Invalid address: " << resolved_ip);
        return INVALID_SOCKET_VALUE;
    }

    socket_t client_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create client socket");
        return INVALID_SOCKET_VALUE;
    }

    bool connected;
    if (timeout_ms > 0) {
        connected = connect_with_timeout(client_socket, (struct sockaddr*)&server_addr, sizeof(server_addr), timeout_ms);
    } else {
        connected = connect(client_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) != SOCKET_ERROR_VALUE;
    }

    if (!connected) {
        LOG_SOCKET_WARN("Connection to " << resolved_ip << ":" << port << " failed");
        close_socket(client_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Connected to " << resolved_ip << ":" << port);
    return client_socket;
}

socket_t create_tcp_server_v4(int port, int backlog, const std::string& bind_address) {
    LOG_SOCKET_DEBUG("Creating TCP server socket on port " << port);

    if (port < 0 || port > 65535) {
        LOG_SOCKET_ERROR("Invalid port number: " << port << " (must be 0-65535)");
        return INVALID_SOCKET_VALUE;
    }

    socket_t server_socket = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to create server socket");
        return INVALID_SOCKET_VALUE;
    }

    int opt = 1;
    if (setsockopt(server_socket, SOL_SOCKET, SO_REUSEADDR, (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to set socket options");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(static_cast<uint16_t>(port));
    if (bind_address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address.c_str(), &server_addr.sin_addr) <= 0) {
        LOG_SOCKET_ERROR("Invalid bind address: " << bind_address);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (bind(server_socket, (struct sockaddr*)&server_addr, sizeof(server_addr)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to bind server socket to port " << port);
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    if (listen(server_socket, backlog) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to listen on server socket");
        close_socket(server_socket);
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Server listening on port " << get_ephemeral_port(server_socket) << " (backlog: " << backlog << ")");
    return server_socket;
}

socket_t accept_client(socket_t server_socket) {
    sockaddr_storage client_addr;
    socklen_t client_addr_len = sizeof(client_addr);

    socket_t client_socket = accept(server_socket, (struct sockaddr*)&client_addr, &client_addr_len);
    if (client_socket == INVALID_SOCKET_VALUE) {
        LOG_SOCKET_ERROR("Failed to accept client connection");
        return INVALID_SOCKET_VALUE;
    }

    LOG_SOCKET_INFO("Client connected from " << get_peer_address(client_socket));
    return client_socket;
}

int wait_for_readable(socket_t socket, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = socket;
    pfd.events = POLLRDNORM;
    pfd.revents = 0;
    int ready = WSAPoll(&pfd, 1, timeout_ms);
#else
    struct pollfd pfd;
    pfd.fd = socket;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready;
    do {
        ready = poll(&pfd, 1, timeout_ms);
    } while (ready < 0 && interrupted(last_socket_error()));
#endif
    if (ready < 0) {
        return -1;
    }
    return ready > 0 ? 1 : 0;
}

std::string get_peer_address(socket_t socket) {
    sockaddr_storage peer_addr;
    socklen_t peer_addr_len = sizeof(peer_addr);

    if (getpeername(socket, (struct sockaddr*)&peer_addr, &peer_addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get peer address for socket " << socket);
        return "";
    }

    if (peer_addr.ss_family != AF_INET) {
        LOG_SOCKET_WARN("Unexpected address family for socket " << socket);
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)&peer_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
    return std::string(ip_str) + ":" + std::to_string(ntohs(addr_in->sin_port));
}

int get_ephemeral_port(socket_t socket) {
    sockaddr_storage local_addr;
    socklen_t addr_len = sizeof(local_addr);

    if (getsockname(socket, (struct sockaddr*)&local_addr, &addr_len) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_ERROR("Failed to get local port for socket " << socket);
        return -1;
    }

    if (local_addr.ss_family == AF_INET) {
        return ntohs(((struct sockaddr_in*)&local_addr)->sin_port);
    }
    if (local_addr.ss_family == AF_INET6) {
        return ntohs(((struct sockaddr_in6*)&local_addr)->sin6_port);
    }
    return -1;
}

bool send_all(socket_t socket, const uint8_t* data, size_t size) {
    size_t total_sent = 0;
    while (total_sent < size) {
        int chunk = static_cast<int>(std::min<size_t>(size - total_sent, 1 << 20));
        int bytes_sent = send(socket, (const char*)data + total_sent, chunk, PEERDROP_SEND_FLAGS);
        if (bytes_sent == SOCKET_ERROR_VALUE) {
            int error = last_socket_error();
            if (interrupted(error)) {
                continue;
            }
            LOG_SOCKET_DEBUG("send() failed on socket " << socket << ": " << error);
            return false;
        }
        total_sent += static_cast<size_t>(bytes_sent);
    }
    return true;
}

bool receive_exact_bytes(socket_t socket, uint8_t* buffer, size_t num_bytes) {
    size_t total_received = 0;
    while (total_received < num_bytes) {
        int chunk = static_cast<int>(std::min<size_t>(num_bytes - total_received, 1 << 20));
        int bytes_received = recv(socket, (char*)buffer + total_received, chunk, 0);
        if (bytes_received == 0) {
            LOG_SOCKET_DEBUG("Connection closed by peer on socket " << socket);
            return false;
        }
        if (bytes_received == SOCKET_ERROR_VALUE) {
            int error = last_socket_error();
            if (interrupted(error)) {
                continue;
            }
            LOG_SOCKET_DEBUG("recv() failed on socket " << socket << ": " << error);
            return false;
        }
        total_received += static_cast<size_t>(bytes_received);
    }
    return true;
}

void close_socket(socket_t socket) {
    if (is_valid_socket(socket)) {
        LOG_SOCKET_DEBUG("Closing socket " << socket);
        closesocket(socket);
    }
}

void shutdown_socket(socket_t socket) {
    if (!is_valid_socket(socket)) {
        return;
    }
#ifdef _WIN32
    shutdown(socket, SD_BOTH);
#else
    shutdown(socket, SHUT_RDWR);
#endif
}

bool is_valid_socket(socket_t socket) {
    return socket != INVALID_SOCKET_VALUE;
}

bool set_socket_nonblocking(socket_t socket) {
#ifdef _WIN32
    unsigned long mode = 1;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1 || fcntl(socket, F_SETFL, flags | O_NONBLOCK) == -1) {
        LOG_SOCKET_ERROR("Failed to set socket to non-blocking mode");
        return false;
    }
#endif
    return true;
}

bool set_socket_blocking(socket_t socket) {
#ifdef _WIN32
    unsigned long mode = 0;
    if (ioctlsocket(socket, FIONBIO, &mode) != 0) {
        LOG_SOCKET_ERROR("Failed to set socket to blocking mode");
        return false;
    }
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags == -1 || fcntl(socket, F_SETFL, flags & ~O_NONBLOCK) == -1) {
        LOG_SOCKET_ERROR("Failed to set socket to blocking mode");
        return false;
    }
#endif
    return true;
}

bool set_tcp_nodelay(socket_t socket) {
    int opt = 1;
    if (setsockopt(socket, IPPROTO_TCP, TCP_NODELAY, (char*)&opt, sizeof(opt)) == SOCKET_ERROR_VALUE) {
        LOG_SOCKET_WARN("Failed to set TCP_NODELAY on socket " << socket);
        return false;
    }
    return true;
}

} // namespace peerdrop
