#ifndef DEVICE_DISCOVERY_HPP
#define DEVICE_DISCOVERY_HPP

#include <chrono>

#include "device.hpp"
#include "prober.hpp"
#include "selection_state.hpp"

namespace discovery
{

// Multicast first, the port scan only runs if the multicast run found nothing.
// Every run replaces the devices published in the selection state.
class device_discovery
{
public:

    static constexpr std::chrono::milliseconds default_timeout {3000};

    device_discovery() = delete;
    device_discovery(const device_discovery&) = delete;
    device_discovery& operator=(const device_discovery&) = delete;
    ~device_discovery() = default;

    device_discovery(proxy::selection_state& state, prober& primary, prober& fallback)
        : m_state {state}, m_primary {primary}, m_fallback {fallback}
    {}

    soundtouch::device_map discover(std::chrono::milliseconds timeout = default_timeout);

private:

    proxy::selection_state& m_state;

    prober& m_primary;

    prober& m_fallback;

};

} // namespace discovery

#endif
