#ifndef DISCOVERY_PROBER_HPP
#define DISCOVERY_PROBER_HPP

#include <chrono>

#include "device.hpp"

namespace discovery
{

// One strategy to find speakers in the local network
class prober
{
public:
    virtual ~prober() = default;

    virtual soundtouch::device_map run(std::chrono::milliseconds timeout) = 0;

    virtual const char* name() const = 0;
};

} // namespace discovery

#endif
