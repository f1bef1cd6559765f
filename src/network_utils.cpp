#ifdef _WIN32
    #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
    #endif
    #include <winsock2.h>
    #include <ws2tcpip.h>
#else
    #include <netdb.h>
    #include <arpa/inet.h>
    #include <netinet/in.h>
    #include <net/if.h>
    #include <ifaddrs.h>
#endif

#include "network_utils.h"
#include "logger.h"
#include <algorithm>
#include <cerrno>
#include <cstring>

#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace peerdrop {
namespace network_utils {

std::string resolve_hostname(const std::string& hostname) {
    if (hostname.empty()) {
        LOG_NETUTILS_DEBUG("Empty hostname provided");
        return "";
    }

    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    struct addrinfo hints, *result;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
#ifdef _WIN32
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << WSAGetLastError());
#else
        LOG_NETUTILS_ERROR("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
#endif
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = (struct sockaddr_in*)result->ai_addr;
    inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
    freeaddrinfo(result);

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip_str);
    return std::string(ip_str);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_loopback_ipv4(const std::string& ip_str) {
    return is_valid_ipv4(ip_str) && ip_str.compare(0, 4, "127.") == 0;
}

std::vector<std::string> get_local_interface_addresses_v4(bool include_loopback) {
    std::vector<std::string> addresses;

#ifdef _WIN32
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) == 0) {
        struct addrinfo hints, *result;
        memset(&hints, 0, sizeof(hints));
        hints.ai_family = AF_INET;
        if (getaddrinfo(hostname, nullptr, &hints, &result) == 0) {
            for (struct addrinfo* rp = result; rp != nullptr; rp = rp->ai_next) {
                char ip_str[INET_ADDRSTRLEN];
                struct sockaddr_in* addr_in = (struct sockaddr_in*)rp->ai_addr;
                inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
                addresses.push_back(ip_str);
            }
            freeaddrinfo(result);
        }
    }
    addresses.push_back("127.0.0.1");
#else
    struct ifaddrs* ifaddr = nullptr;
    if (getifaddrs(&ifaddr) == -1) {
        LOG_NETUTILS_ERROR("getifaddrs failed: " << strerror(errno));
        return include_loopback ? std::vector<std::string>{"127.0.0.1"} : addresses;
    }

    for (struct ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) {
            continue;
        }
        if (!(ifa->ifa_flags & IFF_UP)) {
            continue;
        }
        char ip_str[INET_ADDRSTRLEN];
        struct sockaddr_in* addr_in = (struct sockaddr_in*)ifa->ifa_addr;
        if (inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN)) {
            addresses.push_back(ip_str);
        }
    }
    freeifaddrs(ifaddr);
#endif

    // Loopback first, then interface order; drop duplicates
    std::stable_partition(addresses.begin(), addresses.end(), is_loopback_ipv4);
    std::vector<std::string> unique_addresses;
    for (const auto& address : addresses) {
        if (!include_loopback && is_loopback_ipv4(address)) {
            continue;
        }
        if (std::find(unique_addresses.begin(), unique_addresses.end(), address) == unique_addresses.end()) {
            unique_addresses.push_back(address);
        }
    }

    if (unique_addresses.empty()) {
        LOG_NETUTILS_WARN("No usable IPv4 interface addresses found");
    }
    return unique_addresses;
}

} // namespace network_utils
} // namespace peerdrop
