#include "http/client.hpp"

#include <socketwrapper.hpp>

#include <array>
#include <memory>

#include "utils.hpp"

namespace http
{

using namespace std::chrono;

response client::send(const std::string& host, uint16_t port, request req, milliseconds timeout) const
{
    const auto deadline = steady_clock::now() + timeout;

    std::optional<std::string> addr = utils::resolve_ipv4(host);
    if(!addr)
        throw connection_error {"Name or service not known: " + host};

    // socketwrapper connects blocking, so check that the port answers in time first.
    // The probe connection is closed again, so every call connects twice.
    switch(utils::probe_port(*addr, port, timeout))
    {
        case utils::port_state::closed:
            throw connection_error {"Connection refused"};
        case utils::port_state::unreachable:
            throw connection_error {"Connection timed out"};
        case utils::port_state::open:
            break;
    }

    req.set_header("Host", host + ':' + std::to_string(port));
    req.set_header("Connection", "close");
    const std::string req_str = req.to_string();

    std::unique_ptr<net::tcp_connection<net::ip_version::v4>> conn;
    try {
        conn = std::make_unique<net::tcp_connection<net::ip_version::v4>>(*addr, port);
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            throw connection_error {"Connection timed out"};
        if(!utils::set_send_timeout(conn->get(), remaining))
            throw connection_error {"Unable to set send timeout"};
        conn->send(net::span {req_str.begin(), req_str.end()});
    } catch(std::runtime_error& e) {
        throw connection_error {e.what()};
    }

    std::string raw;
    std::array<char, 4096> buffer;
    while(true)
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0 || !utils::wait_readable(conn->get(), remaining))
            throw connection_error {"timed out"};

        size_t br;
        try {
            br = conn->read(net::span {buffer});
        } catch(std::runtime_error& e) {
            throw connection_error {e.what()};
        }

        if(br == 0)
            break;

        raw.append(buffer.data(), br);
        if(std::optional<size_t> size = response::complete_size(raw); size && raw.size() >= *size)
            break;
    }

    if(raw.empty())
        throw connection_error {"Remote end closed connection without response"};

    return response::parse(raw);
}

} // namespace http
