#ifndef SOUNDTOUCH_DEVICE_HPP
#define SOUNDTOUCH_DEVICE_HPP

#include <cstdint>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

using nlohmann::json;

namespace soundtouch
{

// Port of the speaker's HTTP control API
constexpr uint16_t device_port = 8090;

struct device
{
    std::string ip;
    std::string name;
    std::string type;
    std::string device_id;

    bool operator==(const device& other) const
    {
        return ip == other.ip && name == other.name && type == other.type && device_id == other.device_id;
    }
};

// Result of one discovery run, keyed by ip
using device_map = std::map<std::string, device>;

inline void to_json(json& j, const device& dev)
{
    j = json {
        {"name", dev.name},
        {"type", dev.type},
        {"deviceId", dev.device_id},
        {"ip", dev.ip}
    };
}

} // namespace soundtouch

#endif
