#include "port_scanner.hpp"

#include <future>
#include <optional>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>

#include "thread_pool.hpp"
#include "utils.hpp"

namespace discovery
{

static const char* fallback_prefix = "192.168.1";

soundtouch::device_map port_scanner::scan(const std::string& subnet_prefix, std::chrono::milliseconds probe_timeout) const
{
    fmt::print("Scanning network {}.0/24 for SoundTouch devices...\n", subnet_prefix);

    std::vector<std::future<std::optional<soundtouch::device>>> probes;
    probes.reserve(254);

    {
        utils::thread_pool pool {m_max_parallel};
        for(int host = 1; host < 255; host++)
        {
            std::string ip = fmt::format("{}.{}", subnet_prefix, host);
            probes.push_back(pool.submit([this, ip = std::move(ip), probe_timeout]() -> std::optional<soundtouch::device>
            {
                if(utils::probe_port(ip, m_fetcher.port(), probe_timeout) != utils::port_state::open)
                    return std::nullopt;

                probe_result res = m_fetcher.probe(ip);
                if(!res.device)
                    fmt::print("Port {} open on {} but no SoundTouch ({}: {})\n", m_fetcher.port(), ip, to_string(res.status), res.reason);
                return std::move(res.device);
            }));
        }
        // Leaving the scope joins the pool after the queue ran empty
    }

    soundtouch::device_map devices;
    for(auto& fut : probes)
    {
        try {
            if(std::optional<soundtouch::device> dev = fut.get())
                devices.emplace(dev->ip, std::move(*dev));
        } catch(std::exception& e) {
            fmt::print(stderr, "Scan probe failed: {}\n", e.what());
        }
    }

    return devices;
}

soundtouch::device_map port_scanner::run(std::chrono::milliseconds)
{
    std::string prefix = fallback_prefix;
    try {
        prefix = utils::subnet_prefix(utils::get_local_ipaddr());
    } catch(std::exception& e) {
        fmt::print(stderr, "{}, scanning {}.0/24\n", e.what(), fallback_prefix);
    }

    return scan(prefix);
}

} // namespace discovery
