#include "device_discovery.hpp"

#include <fmt/format.h>

namespace discovery
{

soundtouch::device_map device_discovery::discover(std::chrono::milliseconds timeout)
{
    fmt::print("Starting device discovery...\n");

    soundtouch::device_map devices = m_primary.run(timeout);
    if(devices.empty())
    {
        fmt::print("{} found nothing, falling back to {}\n", m_primary.name(), m_fallback.name());
        devices = m_fallback.run(timeout);
    }

    fmt::print("Found {} device(s)\n", devices.size());

    m_state.publish(devices);
    return devices;
}

} // namespace discovery
