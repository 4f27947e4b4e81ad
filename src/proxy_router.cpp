#include "proxy_router.hpp"

#include <ctime>
#include <filesystem>
#include <map>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

using nlohmann::json;

namespace proxy
{

static constexpr std::string_view api_prefix {"/api"};
static constexpr std::string_view override_marker {"?device="};

// Polled by the UI every few seconds, logging them would drown everything else
static bool is_quiet_path(const std::string& path)
{
    return path == "/api/now_playing" || path == "/api/volume";
}

static http::response json_response(const json& body)
{
    http::response res {200};
    res.set_header("Content-Type", "application/json");
    res.set_body(body.dump());
    return res;
}

static http::response error_response(int code, const std::string& message)
{
    http::response res {code};
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    res.set_body(fmt::format("{} {}: {}\n", code, http::get_http_phrase(code), message));
    return res;
}

static std::string mime_type(const std::filesystem::path& file)
{
    static const std::map<std::string, std::string> types {
        {".html", "text/html; charset=UTF-8"},
        {".htm", "text/html; charset=UTF-8"},
        {".js", "text/javascript"},
        {".css", "text/css"},
        {".json", "application/json"},
        {".ico", "image/x-icon"},
        {".png", "image/png"},
        {".svg", "image/svg+xml"},
    };

    auto it = types.find(file.extension().string());
    return (it != types.end()) ? it->second : "application/octet-stream";
}

api_target split_override(std::string_view path)
{
    size_t pos = path.find(override_marker);
    if(pos == std::string_view::npos)
        return {std::string {path}, std::nullopt};

    std::string_view value = path.substr(pos + override_marker.size());
    size_t amp = value.find('&');
    if(amp != std::string_view::npos)
        value = value.substr(0, amp);

    return {
        std::string {path.substr(0, pos)},
        value.empty() ? std::nullopt : std::optional<std::string> {std::string {value}}
    };
}

http::response proxy_router::handle(const http::request& req)
{
    const std::string& method = req.get_method();
    const std::string& path = req.get_path();

    http::response res;
    if(method == "OPTIONS")
        res = preflight();
    else if(method == "GET" && path == "/discover")
        res = discover();
    else if(method == "GET" && path == "/current-device")
        res = current_device();
    else if(method == "POST" && path == "/set-device")
        res = set_device(req);
    else if((method == "GET" || method == "POST") && path.compare(0, api_prefix.size() + 1, "/api/") == 0)
        res = forward(req);
    else if(method == "GET" && !m_web_root.empty())
        res = serve_static(req);
    else
        res = error_response(404, fmt::format("No route for {} {}", method, path));

    res.set_header("Access-Control-Allow-Origin", "*");

    if(!is_quiet_path(path))
    {
        fmt::print("[{:%d/%b/%Y %H:%M:%S}] \"{} {} {}\" {}\n", fmt::localtime(std::time(nullptr)),
            method, req.get_resource(), req.get_protocol(), res.get_code());
    }

    return res;
}

http::response proxy_router::forward(const http::request& req) const
{
    std::string_view resource {req.get_resource()};
    resource.remove_prefix(api_prefix.size());

    api_target target = split_override(resource);
    std::optional<std::string> device_ip = target.device ? target.device : m_state.current_device();
    if(!device_ip || device_ip->empty())
        return error_response(412, "No device selected. Please discover and select a device first.");

    http::request upstream_req {req.get_method(), target.path};
    upstream_req.set_header("Content-Type", "application/xml");
    if(req.get_method() == "POST")
        upstream_req.set_body(req.get_body());

    try {
        http::response upstream = m_upstream.send(*device_ip, m_device_port, std::move(upstream_req), forward_timeout);

        http::response res {upstream.get_code()};
        if(!upstream.get_phrase().empty())
            res.set_code(upstream.get_code(), std::string {upstream.get_phrase()});

        std::string content_type = upstream.get_header("Content-Type");
        res.set_header("Content-Type", content_type.empty() ? "application/xml" : std::move(content_type));
        res.set_body(upstream.get_body());
        return res;
    } catch(http::connection_error& e) {
        fmt::print(stderr, "Forwarding to {} failed: {}\n", *device_ip, e.what());
        return error_response(502, fmt::format("Error connecting to SoundTouch: {}", e.what()));
    } catch(std::exception& e) {
        fmt::print(stderr, "Forwarding to {} failed: {}\n", *device_ip, e.what());
        return error_response(500, fmt::format("Proxy error: {}", e.what()));
    }
}

http::response proxy_router::current_device() const
{
    selection sel = m_state.get();

    json body;
    body["ip"] = sel.current_ip ? json(*sel.current_ip) : json(nullptr);
    body["devices"] = *sel.devices;
    return json_response(body);
}

http::response proxy_router::set_device(const http::request& req)
{
    json body = json::parse(req.get_body(), nullptr, false);
    if(body.is_discarded() || !body.is_object())
        return error_response(400, "Expected a JSON object like {\"ip\": \"<address>\"}");

    std::optional<std::string> ip;
    auto it = body.find("ip");
    if(it != body.end() && !it->is_null())
    {
        if(!it->is_string())
            return error_response(400, "ip must be a string");
        ip = it->get<std::string>();
    }

    m_state.set_device(ip);
    fmt::print("Device set to: {}\n", ip.value_or("none"));

    return json_response(json {
        {"success", true},
        {"ip", ip ? json(*ip) : json(nullptr)}
    });
}

http::response proxy_router::discover()
{
    soundtouch::device_map devices = m_discovery.discover();
    return json_response(json(devices));
}

http::response proxy_router::preflight()
{
    http::response res {200};
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
    res.set_body("");
    return res;
}

http::response proxy_router::serve_static(const http::request& req) const
{
    std::string path = req.get_path();
    if(path == "/")
        path = "/index.html";

    if(path.find("..") != std::string::npos)
        return error_response(404, "File not found");

    std::filesystem::path file = std::filesystem::path {m_web_root} / path.substr(1);
    std::error_code ec;
    if(!std::filesystem::is_regular_file(file, ec))
        return error_response(404, "File not found");

    http::response res {200};
    try {
        res.set_body_from_file(file.string());
    } catch(std::invalid_argument& e) {
        return error_response(404, e.what());
    }
    res.set_header("Content-Type", mime_type(file));
    return res;
}

} // namespace proxy
