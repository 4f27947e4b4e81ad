#ifndef PROXY_ROUTER_HPP
#define PROXY_ROUTER_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "device.hpp"
#include "device_discovery.hpp"
#include "http/client.hpp"
#include "http/request.hpp"
#include "http/response.hpp"
#include "selection_state.hpp"

namespace proxy
{

struct api_target
{
    std::string path;
    std::optional<std::string> device;
};

// "/now_playing?device=10.0.0.9&x=1" -> {"/now_playing", "10.0.0.9"}
// The address is taken as is, it is neither decoded nor validated.
api_target split_override(std::string_view path);

// Local control endpoint:
//   GET  /discover        run a discovery and return the devices found
//   GET  /current-device  selected ip and the last discovery result
//   POST /set-device      select a device, body {"ip": "..."}
//   GET|POST /api/<rest>  forwarded to the selected device or to ?device=<ip>
//   OPTIONS *             CORS preflight
class proxy_router
{
public:

    static constexpr std::chrono::milliseconds forward_timeout {10000};

    proxy_router() = delete;
    proxy_router(const proxy_router&) = delete;
    proxy_router& operator=(const proxy_router&) = delete;
    ~proxy_router() = default;

    proxy_router(selection_state& state, discovery::device_discovery& discovery,
        const http::client& upstream, uint16_t device_port = soundtouch::device_port)
        : m_state {state}, m_discovery {discovery}, m_upstream {upstream}, m_device_port {device_port}
    {}

    // Files below web_root are served for GET requests no other route matches.
    // Empty disables static files.
    void set_web_root(std::string web_root)
    {
        m_web_root = std::move(web_root);
    }

    http::response handle(const http::request& req);

    http::response forward(const http::request& req) const;

    http::response current_device() const;

    http::response set_device(const http::request& req);

    http::response discover();

    static http::response preflight();

private:

    http::response serve_static(const http::request& req) const;

    selection_state& m_state;

    discovery::device_discovery& m_discovery;

    const http::client& m_upstream;

    uint16_t m_device_port;

    std::string m_web_root;

};

} // namespace proxy

#endif
