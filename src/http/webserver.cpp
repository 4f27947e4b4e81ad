#include "http/webserver.hpp"

#include <array>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "utils.hpp"

namespace http
{

using connection = net::tcp_connection<net::ip_version::v4>;

static void send_response(connection& conn, const response& res)
{
    const std::string res_str = res.to_string();
    conn.send(net::span {res_str.begin(), res_str.end()});
}

static response error_response(int code)
{
    response res {code};
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_body(fmt::format("{} {}", code, get_http_phrase(code)));
    return res;
}

void webserver::handle_connection(connection& conn) const
{
    std::string raw;
    std::array<char, 4096> buffer;
    std::optional<size_t> expected;

    try {
        while(!expected || raw.size() < *expected)
        {
            if(!utils::wait_readable(conn.get(), read_timeout))
            {
                if(!raw.empty())
                    send_response(conn, error_response(408));
                return;
            }

            size_t br = conn.read(net::span {buffer});
            if(br == 0)
                return;
            raw.append(buffer.data(), br);

            if(!expected)
                expected = request::expected_size(raw);
            if(raw.size() > max_request_size || (expected && *expected > max_request_size))
            {
                send_response(conn, error_response(413));
                return;
            }
        }
    } catch(std::invalid_argument& e) {
        fmt::print(stderr, "Malformed request: {}\n", e.what());
        send_response(conn, error_response(400));
        return;
    }

    request req;
    try {
        req.parse(raw);
    } catch(std::invalid_argument& e) {
        fmt::print(stderr, "Malformed request: {}\n", e.what());
        send_response(conn, error_response(400));
        return;
    }

    response res;
    try {
        res = m_handler(req);
    } catch(std::exception& e) {
        fmt::print(stderr, "Error handling {} {}: {}\n", req.get_method(), req.get_path(), e.what());
        res = error_response(500);
    }

    res.set_header("Connection", "close");
    send_response(conn, res);
}

void webserver::serve(std::atomic<bool>& run_condition)
{
    while(run_condition.load())
    {
        std::shared_ptr<connection> conn;
        try {
            conn = std::make_shared<connection>(m_acceptor.accept());
        } catch(std::runtime_error& e) {
            if(run_condition.load())
                fmt::print(stderr, "Accept failed: {}\n", e.what());
            continue;
        }

        if(!run_condition.load())
            break;

        m_pool.submit([this, conn]()
        {
            try {
                handle_connection(*conn);
            } catch(std::runtime_error& e) {
                // Client went away while we were answering
                fmt::print(stderr, "Connection error: {}\n", e.what());
            }
        });
    }
}

} // namespace http
