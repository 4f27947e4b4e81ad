#ifndef HTTP_WEBSERVER_HPP
#define HTTP_WEBSERVER_HPP

#include <socketwrapper.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <string_view>

#include "http/request.hpp"
#include "http/response.hpp"
#include "thread_pool.hpp"

namespace http
{

using request_handler = std::function<response(const request&)>;

// Plain HTTP/1.1 without keep-alive. Every accepted connection is handed to the
// worker pool, so at most num_workers requests are processed at the same time.
class webserver
{
public:
    webserver() = delete;
    webserver(const webserver&) = delete;
    webserver& operator=(const webserver&) = delete;
    webserver(webserver&&) = delete;
    webserver& operator=(webserver&&) = delete;
    ~webserver() = default;

    webserver(std::string_view bind_addr, uint16_t port, request_handler handler, size_t num_workers = 8)
        : m_acceptor {bind_addr, port},
          m_handler {std::move(handler)},
          m_pool {num_workers}
    {}

    // Blocks until run_condition is false. A connection is needed to wake up a
    // pending accept after run_condition changed.
    void serve(std::atomic<bool>& run_condition);

    static constexpr size_t max_request_size = 1024 * 1024;

    static constexpr std::chrono::milliseconds read_timeout {5000};

private:

    void handle_connection(net::tcp_connection<net::ip_version::v4>& conn) const;

    net::tcp_acceptor<net::ip_version::v4> m_acceptor;

    request_handler m_handler;

    utils::thread_pool m_pool;

};

} // namespace http

#endif
