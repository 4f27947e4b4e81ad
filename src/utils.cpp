#include <utils.hpp>

#include <array>
#include <bitset>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <ifaddrs.h>
#include <sys/socket.h>
#include <netdb.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/time.h>
#include <unistd.h>

namespace utils
{

const char* error_msg = "Unable to get local ip address";

namespace
{

struct fd_guard
{
    int fd;

    explicit fd_guard(int f) : fd {f} {}
    fd_guard(const fd_guard&) = delete;
    fd_guard& operator=(const fd_guard&) = delete;
    ~fd_guard()
    {
        if(fd >= 0)
            ::close(fd);
    }
};

std::optional<std::string> route_lookup_ipaddr()
{
    fd_guard sock {::socket(AF_INET, SOCK_DGRAM, 0)};
    if(sock.fd < 0)
        return std::nullopt;

    sockaddr_in remote {};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    ::inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    // Connecting a datagram socket only selects the route, no packet leaves the host
    if(::connect(sock.fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote)) != 0)
        return std::nullopt;

    sockaddr_in local {};
    socklen_t len = sizeof(local);
    if(::getsockname(sock.fd, reinterpret_cast<sockaddr*>(&local), &len) != 0)
        return std::nullopt;

    std::array<char, INET_ADDRSTRLEN> host;
    if(::inet_ntop(AF_INET, &local.sin_addr, host.data(), host.size()) == nullptr)
        return std::nullopt;

    return std::string {host.data()};
}

std::optional<std::string> interface_ipaddr()
{
    ifaddrs* addrs;
    if(getifaddrs(&addrs))
        return std::nullopt;

    std::optional<std::string> found;
    for(ifaddrs* curr_addr = addrs; curr_addr != nullptr; curr_addr = curr_addr->ifa_next)
    {
        if(curr_addr->ifa_addr == nullptr || curr_addr->ifa_addr->sa_family != AF_INET)
            continue;

        std::array<char, NI_MAXHOST> host;
        if(getnameinfo(curr_addr->ifa_addr, sizeof(sockaddr_in), host.data(), NI_MAXHOST, nullptr, 0, NI_NUMERICHOST) != 0)
            continue;

        std::bitset<sizeof(unsigned int) * 8> flags {curr_addr->ifa_flags};
        if(flags.test(IFF_UP) && !flags.test(IFF_LOOPBACK))
        {
            found = host.data();
            break;
        }
    }

    freeifaddrs(addrs);
    return found;
}

} // namespace

std::string get_local_ipaddr()
{
    if(auto addr = route_lookup_ipaddr())
        return *addr;
    if(auto addr = interface_ipaddr())
        return *addr;

    throw std::runtime_error {error_msg};
}

std::string subnet_prefix(std::string_view ipaddr)
{
    size_t pos = ipaddr.rfind('.');
    if(pos == std::string_view::npos || pos == 0)
        throw std::invalid_argument {"Not an IPv4 address: " + std::string {ipaddr}};

    return std::string {ipaddr.substr(0, pos)};
}

std::optional<std::string> resolve_ipv4(const std::string& host)
{
    if(host.empty())
        return std::nullopt;

    in_addr numeric;
    if(::inet_pton(AF_INET, host.c_str(), &numeric) == 1)
        return host;

    addrinfo hints {};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    if(::getaddrinfo(host.c_str(), nullptr, &hints, &res) != 0 || res == nullptr)
        return std::nullopt;

    std::array<char, INET_ADDRSTRLEN> buf;
    const auto* sin = reinterpret_cast<const sockaddr_in*>(res->ai_addr);
    std::optional<std::string> resolved;
    if(::inet_ntop(AF_INET, &sin->sin_addr, buf.data(), buf.size()) != nullptr)
        resolved = buf.data();

    ::freeaddrinfo(res);
    return resolved;
}

port_state probe_port(const std::string& ipaddr, uint16_t port, std::chrono::milliseconds timeout)
{
    sockaddr_in remote {};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(port);
    if(::inet_pton(AF_INET, ipaddr.c_str(), &remote.sin_addr) != 1)
        return port_state::unreachable;

    fd_guard sock {::socket(AF_INET, SOCK_STREAM, 0)};
    if(sock.fd < 0)
        return port_state::unreachable;

    int flags = ::fcntl(sock.fd, F_GETFL, 0);
    if(flags < 0 || ::fcntl(sock.fd, F_SETFL, flags | O_NONBLOCK) < 0)
        return port_state::unreachable;

    int rc = ::connect(sock.fd, reinterpret_cast<sockaddr*>(&remote), sizeof(remote));
    if(rc == 0)
        return port_state::open;
    if(errno == ECONNREFUSED)
        return port_state::closed;
    if(errno != EINPROGRESS)
        return port_state::unreachable;

    pollfd pfd {};
    pfd.fd = sock.fd;
    pfd.events = POLLOUT;
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if(rc != 1)
        return port_state::unreachable;

    int err = 0;
    socklen_t errlen = sizeof(err);
    if(::getsockopt(sock.fd, SOL_SOCKET, SO_ERROR, &err, &errlen) != 0)
        return port_state::unreachable;

    if(err == 0)
        return port_state::open;
    return (err == ECONNREFUSED) ? port_state::closed : port_state::unreachable;
}

bool set_send_timeout(int fd, std::chrono::milliseconds timeout)
{
    // A zero timeval would mean no timeout at all
    if(timeout.count() <= 0)
        timeout = std::chrono::milliseconds {1};

    timeval tv {};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool wait_readable(int fd, std::chrono::milliseconds timeout)
{
    if(timeout.count() < 0)
        timeout = std::chrono::milliseconds {0};

    pollfd pfd {};
    pfd.fd = fd;
    pfd.events = POLLIN;

    int rc;
    do {
        rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    } while(rc < 0 && errno == EINTR);

    return rc > 0;
}

} // utils
