#ifndef SELECTION_STATE_HPP
#define SELECTION_STATE_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "device.hpp"

namespace proxy
{

struct selection
{
    std::optional<std::string> current_ip;
    std::shared_ptr<const soundtouch::device_map> devices;
};

// Currently selected speaker and the result of the last discovery run. Shared by
// every request handler, so all access goes through one mutex. Discovery results
// are published as immutable snapshots: a reader keeps the map it got even if a
// newer run replaces it.
class selection_state
{
public:

    selection_state();
    selection_state(const selection_state&) = delete;
    selection_state& operator=(const selection_state&) = delete;
    ~selection_state() = default;

    selection get() const;

    std::optional<std::string> current_device() const;

    // No check whether the ip was discovered or is reachable. std::nullopt clears the selection.
    void set_device(std::optional<std::string> ip);

    void publish(soundtouch::device_map devices);

private:

    mutable std::mutex m_mutex;

    std::optional<std::string> m_current_ip;

    std::shared_ptr<const soundtouch::device_map> m_devices;

};

} // namespace proxy

#endif
