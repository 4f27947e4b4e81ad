#include "ssdp_discovery.hpp"

#include <socketwrapper.hpp>

#include <algorithm>
#include <memory>
#include <stdexcept>

#include <fmt/format.h>

#include "utils.hpp"

namespace discovery
{

using namespace std::chrono;

std::string search_request()
{
    return "M-SEARCH * HTTP/1.1\r\n"
        "HOST: " DISCOVERY_IP ":" + std::to_string(DISCOVERY_PORT) + "\r\n"
        "MAN: \"ssdp:discover\"\r\n"
        "MX: 2\r\n"
        "ST: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
        "\r\n";
}

bool is_vendor_response(std::string_view response)
{
    return response.find("Bose") != std::string_view::npos ||
        response.find("SoundTouch") != std::string_view::npos;
}

soundtouch::device_map ssdp_prober::probe(milliseconds timeout) const
{
    soundtouch::device_map devices;
    const auto deadline = steady_clock::now() + timeout;
    const std::string msg = search_request();

    // Ephemeral port, the answers are sent unicast to the sender of the M-SEARCH
    std::unique_ptr<net::udp_socket<net::ip_version::v4>> d_sock;
    try {
        d_sock = std::make_unique<net::udp_socket<net::ip_version::v4>>("0.0.0.0", 0);
        d_sock->send(m_target_addr, m_target_port, msg);
    } catch(std::runtime_error& e) {
        fmt::print(stderr, "SSDP discovery error: {}\n", e.what());
        return devices;
    }

    while(true)
    {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            break;

        // A quiet socket ends the run even if there is time left
        if(!utils::wait_readable(d_sock->get(), std::min(remaining, m_read_timeout)))
            break;

        std::string ip;
        try {
            auto [buffer, peer] = d_sock->read<char>(4096);
            if(!is_vendor_response(std::string_view {buffer.data(), buffer.size()}))
                continue;
            ip = peer.addr;
        } catch(std::runtime_error& e) {
            fmt::print(stderr, "SSDP receive error: {}\n", e.what());
            continue;
        }

        if(devices.find(ip) != devices.end())
            continue;

        remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if(remaining.count() <= 0)
            break;

        probe_result res = m_fetcher.probe(ip, std::min(remaining, info_fetcher::default_timeout));
        if(res.device)
            devices.emplace(ip, std::move(*res.device));
        else
            fmt::print("SSDP answer from {} ignored ({}: {})\n", ip, to_string(res.status), res.reason);
    }

    return devices;
}

} // namespace discovery
