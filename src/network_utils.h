#pragma once

#include <string>
#include <vector>

namespace peerdrop {
namespace network_utils {

/**
 * Resolve hostname to IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IP address string, or empty string on error
 */
std::string resolve_hostname(const std::string& hostname);

/**
 * Check if a string is a valid IPv4 address
 * @param ip_str The string to validate
 * @return true if valid IPv4 address, false otherwise
 */
bool is_valid_ipv4(const std::string& ip_str);

// 127.0.0.0/8
bool is_loopback_ipv4(const std::string& ip_str);

/**
 * Get all local IPv4 network interface addresses
 * @param include_loopback Keep 127.x addresses in the result
 * @return Addresses of interfaces that are up, loopback first
 *
 * Example usage:
 *   auto local_ipv4s = network_utils::get_local_interface_addresses_v4(false);
 */
std::vector<std::string> get_local_interface_addresses_v4(bool include_loopback = true);

} // namespace network_utils
} // namespace peerdrop
