#ifndef PORT_SCANNER_HPP
#define PORT_SCANNER_HPP

#include <chrono>
#include <cstddef>
#include <string>

#include "device.hpp"
#include "info_fetcher.hpp"
#include "prober.hpp"

namespace discovery
{

// Sweeps a /24 for hosts listening on the device port and asks each of them for
// its descriptor
class port_scanner : public prober
{
public:

    static constexpr size_t default_max_parallel = 50;

    static constexpr std::chrono::milliseconds default_probe_timeout {1000};

    port_scanner() = delete;
    port_scanner(const port_scanner&) = delete;
    port_scanner& operator=(const port_scanner&) = delete;
    ~port_scanner() override = default;

    explicit port_scanner(const info_fetcher& fetcher, size_t max_parallel = default_max_parallel)
        : m_fetcher {fetcher}, m_max_parallel {max_parallel}
    {}

    // Probes <subnet_prefix>.1 to <subnet_prefix>.254 and returns after every probe finished
    soundtouch::device_map scan(const std::string& subnet_prefix,
        std::chrono::milliseconds probe_timeout = default_probe_timeout) const;

    // Scans the subnet of the local address. The timeout of the discovery run is not
    // used, every probe is limited by default_probe_timeout instead.
    soundtouch::device_map run(std::chrono::milliseconds timeout) override;

    const char* name() const override
    {
        return "port scan";
    }

private:

    const info_fetcher& m_fetcher;

    size_t m_max_parallel;

};

} // namespace discovery

#endif
