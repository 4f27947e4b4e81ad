#ifndef SSDP_DISCOVERY_HPP
#define SSDP_DISCOVERY_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "device.hpp"
#include "info_fetcher.hpp"
#include "prober.hpp"

namespace discovery
{

#define DISCOVERY_IP "239.255.255.250"
#define DISCOVERY_PORT 1900

// M-SEARCH datagram for UPnP media renderers
std::string search_request();

// True if the datagram mentions the vendor or product name
bool is_vendor_response(std::string_view response);

class ssdp_prober : public prober
{
public:

    ssdp_prober() = delete;
    ssdp_prober(const ssdp_prober&) = delete;
    ssdp_prober& operator=(const ssdp_prober&) = delete;
    ~ssdp_prober() override = default;

    static constexpr std::chrono::milliseconds default_read_timeout {3000};

    // read_timeout limits the wait for a single datagram, the timeout passed to
    // probe() limits the whole run
    explicit ssdp_prober(const info_fetcher& fetcher, std::string target_addr = DISCOVERY_IP,
        uint16_t target_port = DISCOVERY_PORT, std::chrono::milliseconds read_timeout = default_read_timeout)
        : m_fetcher {fetcher},
          m_target_addr {std::move(target_addr)},
          m_target_port {target_port},
          m_read_timeout {read_timeout}
    {}

    soundtouch::device_map probe(std::chrono::milliseconds timeout) const;

    soundtouch::device_map run(std::chrono::milliseconds timeout) override
    {
        return probe(timeout);
    }

    const char* name() const override
    {
        return "SSDP";
    }

private:

    const info_fetcher& m_fetcher;

    std::string m_target_addr;

    uint16_t m_target_port;

    std::chrono::milliseconds m_read_timeout;

};

} // namespace discovery

#endif
