#ifndef HTTP_CLIENT_HPP
#define HTTP_CLIENT_HPP

#include <string>
#include <chrono>
#include <stdexcept>
#include <cstdint>

#include "http/request.hpp"
#include "http/response.hpp"

namespace http
{

// Host could not be resolved, refused the connection or did not answer in time
class connection_error : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// One request per connection, the connection is closed after the response
class client
{
public:

    client() = default;
    client(const client&) = delete;
    client& operator=(const client&) = delete;
    virtual ~client() = default;

    // Throws connection_error if host:port is not reachable within timeout and
    // std::invalid_argument if the peer answers with something that is not HTTP.
    virtual response send(const std::string& host, uint16_t port, request req,
        std::chrono::milliseconds timeout) const;

};

} // namespace http

#endif
