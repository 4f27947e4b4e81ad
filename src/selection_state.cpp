#include "selection_state.hpp"

namespace proxy
{

selection_state::selection_state()
    : m_devices {std::make_shared<const soundtouch::device_map>()}
{}

selection selection_state::get() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return selection {m_current_ip, m_devices};
}

std::optional<std::string> selection_state::current_device() const
{
    std::lock_guard<std::mutex> lock {m_mutex};
    return m_current_ip;
}

void selection_state::set_device(std::optional<std::string> ip)
{
    std::lock_guard<std::mutex> lock {m_mutex};
    m_current_ip = std::move(ip);
}

void selection_state::publish(soundtouch::device_map devices)
{
    // Build the snapshot before taking the lock
    auto snapshot = std::make_shared<const soundtouch::device_map>(std::move(devices));

    std::lock_guard<std::mutex> lock {m_mutex};
    m_devices = std::move(snapshot);
}

} // namespace proxy
