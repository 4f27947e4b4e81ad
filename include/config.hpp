#ifndef SOUNDTOUCH_PROXY_CONFIG_HPP
#define SOUNDTOUCH_PROXY_CONFIG_HPP

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace config
{

constexpr uint16_t default_listen_port = 8000;

struct app_config
{
    std::optional<std::string> device_ip;   ///< initially selected speaker
    uint16_t port = default_listen_port;    ///< port of the local control endpoint
    std::string web_root;                   ///< directory with the controller UI, empty = disabled
    bool help = false;
    std::string error;                      ///< set if the command line could not be parsed
};

using env_lookup = std::function<const char*(const char*)>;

void print_usage(const char* program_name);

// Precedence: command line, then SOUNDTOUCH_DEVICE_IP / SOUNDTOUCH_PORT /
// SOUNDTOUCH_WEB_ROOT, then the defaults. Empty environment values are ignored.
app_config parse_args(int argc, char* argv[], const env_lookup& env);

// Reads the process environment
app_config parse_args(int argc, char* argv[]);

} // namespace config

#endif
