#ifndef INFO_FETCHER_HPP
#define INFO_FETCHER_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "device.hpp"
#include "http/client.hpp"

namespace discovery
{

enum class probe_status
{
    found,
    no_match,    // host answered but does not describe itself as a speaker
    unreachable, // connect or read failed or timed out
    error        // anything else went wrong
};

struct probe_result
{
    probe_status status;
    std::optional<soundtouch::device> device;
    std::string reason;
};

std::string_view to_string(probe_status status);

// Extracts name, type and deviceID from the body of GET /info. Returns std::nullopt
// if the body is no XML or has no non-empty <name> element.
std::optional<soundtouch::device> parse_info(std::string_view body, const std::string& ip);

class info_fetcher
{
public:

    static constexpr std::chrono::milliseconds default_timeout {2000};

    explicit info_fetcher(const http::client& client, uint16_t port = soundtouch::device_port)
        : m_client {client}, m_port {port}
    {}

    // Never throws, all failures end up in the status of the result
    probe_result probe(const std::string& ip, std::chrono::milliseconds timeout = default_timeout) const;

    std::optional<soundtouch::device> fetch_info(const std::string& ip,
        std::chrono::milliseconds timeout = default_timeout) const
    {
        return probe(ip, timeout).device;
    }

    uint16_t port() const
    {
        return m_port;
    }

private:

    const http::client& m_client;

    uint16_t m_port;

};

} // namespace discovery

#endif
