#ifndef HTTP_REQUEST_HPP
#define HTTP_REQUEST_HPP

#include <string>
#include <string_view>
#include <optional>

#include "http/message.hpp"

namespace http {

class request {

public:

    request() = default;
    request(const request& other) = default;
    request(request&& other) noexcept = default;
    request& operator=(const request& other) = default;
    request& operator=(request&& other) noexcept = default;
    ~request() = default;

    request(std::string method, std::string resource);

    // Throws std::invalid_argument if the message is not a valid HTTP request
    void parse(std::string_view request);

    std::string to_string() const;

    // Total size of the message once the header block is complete, std::nullopt before that
    static std::optional<size_t> expected_size(std::string_view partial);

    std::string get_header(const std::string& key) const;

    void set_header(const std::string& key, std::string value);

    const std::string& get_method() const { return m_method; }

    const std::string& get_resource() const { return m_resource; }

    const std::string& get_protocol() const { return m_protocol; }

    const std::string& get_path() const { return m_path; }

    const std::string& get_body() const { return m_body; }

    void set_body(std::string body);

private:

    void parse_requestline(std::string_view requestline);

    void split_resource();

    std::string m_method;     /// http method used by this request (e.g. post, get, ...)
    std::string m_protocol {"HTTP/1.1"};
    std::string m_resource;   /// resource addressed by this request including the query string
    std::string m_path;       /// resource without the query string

    header_map m_headers;
    std::string m_body;

};

} // namespace http

#endif
