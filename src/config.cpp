#include "config.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

#include <fmt/format.h>

namespace config
{

static std::optional<uint16_t> parse_port(const char* value)
{
    unsigned int port = 0;
    const char* end = value + std::strlen(value);
    auto res = std::from_chars(value, end, port);
    if(res.ec != std::errc {} || res.ptr != end || port == 0 || port > 65535)
        return std::nullopt;
    return static_cast<uint16_t>(port);
}

static const char* non_empty(const char* value)
{
    return (value != nullptr && value[0] != '\0') ? value : nullptr;
}

void print_usage(const char* program_name)
{
    fmt::print(
        "SoundTouch proxy - discovers Bose SoundTouch speakers and relays their API\n\n"
        "Usage: {} [OPTIONS] [device_ip]\n\n"
        "Arguments:\n"
        "  device_ip             IP address of the SoundTouch device (env: SOUNDTOUCH_DEVICE_IP)\n\n"
        "Options:\n"
        "  -p, --port <port>     Port to run the server on (default: {}, env: SOUNDTOUCH_PORT)\n"
        "  --web-root <dir>      Serve the controller UI from this directory (env: SOUNDTOUCH_WEB_ROOT)\n"
        "  -h, --help            Show this help message\n",
        program_name, default_listen_port);
}

app_config parse_args(int argc, char* argv[], const env_lookup& env)
{
    app_config config;

    if(const char* ip = non_empty(env("SOUNDTOUCH_DEVICE_IP")))
        config.device_ip = ip;
    if(const char* root = non_empty(env("SOUNDTOUCH_WEB_ROOT")))
        config.web_root = root;
    if(const char* port = non_empty(env("SOUNDTOUCH_PORT")))
    {
        std::optional<uint16_t> parsed = parse_port(port);
        if(!parsed)
        {
            config.error = fmt::format("Invalid SOUNDTOUCH_PORT '{}'", port);
            return config;
        }
        config.port = *parsed;
    }

    bool positional_seen = false;
    for(int i = 1; i < argc; i++)
    {
        const char* arg = argv[i];

        if(std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0)
        {
            config.help = true;
            return config;
        }

        if(std::strcmp(arg, "-p") == 0 || std::strcmp(arg, "--port") == 0 || std::strcmp(arg, "--web-root") == 0)
        {
            if(i + 1 >= argc)
            {
                config.error = fmt::format("Option {} requires a value", arg);
                return config;
            }

            const char* value = argv[++i];
            if(std::strcmp(arg, "--web-root") == 0)
            {
                config.web_root = value;
                continue;
            }

            std::optional<uint16_t> parsed = parse_port(value);
            if(!parsed)
            {
                config.error = fmt::format("Invalid port '{}'", value);
                return config;
            }
            config.port = *parsed;
        }
        else if(arg[0] == '-')
        {
            config.error = fmt::format("Unknown option {}", arg);
            return config;
        }
        else if(!positional_seen)
        {
            config.device_ip = arg;
            positional_seen = true;
        }
        else
        {
            config.error = fmt::format("Unexpected argument {}", arg);
            return config;
        }
    }

    return config;
}

app_config parse_args(int argc, char* argv[])
{
    return parse_args(argc, argv, [](const char* name) -> const char* { return std::getenv(name); });
}

} // namespace config
