#ifndef SOUNDTOUCH_PROXY_UTILS_HPP
#define SOUNDTOUCH_PROXY_UTILS_HPP

#include <string>
#include <string_view>
#include <optional>
#include <chrono>
#include <cstdint>

namespace utils
{

enum class port_state
{
    open,
    closed,     // host answered with a reset
    unreachable // timeout, no route or name resolution failed
};

// Local IPv4 address used for outbound traffic. Asks the routing table first
// (UDP "connect" towards a public address, nothing is sent) and falls back to
// the first interface that is up and not a loopback.
std::string get_local_ipaddr();

// "192.168.1.42" -> "192.168.1"
std::string subnet_prefix(std::string_view ipaddr);

std::optional<std::string> resolve_ipv4(const std::string& host);

port_state probe_port(const std::string& ipaddr, uint16_t port, std::chrono::milliseconds timeout);

// Blocking writes on fd fail once they stalled for timeout. Returns false if the
// option could not be set.
bool set_send_timeout(int fd, std::chrono::milliseconds timeout);

// Returns false when the timeout expired before fd got readable
bool wait_readable(int fd, std::chrono::milliseconds timeout);

} // utils

#endif
