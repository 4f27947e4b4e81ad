#include "http/request.hpp"

#include <stdexcept>

namespace http
{

request::request(std::string method, std::string resource)
    : m_method {std::move(method)},
      m_resource {std::move(resource)}
{
    split_resource();
}

void request::parse(std::string_view request)
{
    /* extract the request line */
    size_t pos = request.find("\r\n");
    if(pos == std::string_view::npos)
        throw std::invalid_argument {"invalid_request"};
    parse_requestline(request.substr(0, pos));

    /* Parse resource to path and params */
    split_resource();

    /* Read and parse request headers */
    m_headers.clear();
    size_t body_offset = parse_headers(request, pos + 2, m_headers);

    std::optional<size_t> length = content_length(m_headers);
    std::string_view body = request.substr(body_offset);
    if(length)
    {
        if(body.size() < *length)
            throw std::invalid_argument {"incomplete_body"};
        body = body.substr(0, *length);
    }
    m_body = std::string {body};
}

std::string request::to_string() const
{
    std::string request;
    request.reserve(128 + m_body.size());

    ((((request += m_method) += ' ') += m_resource) += ' ') += m_protocol;
    request += "\r\n";

    for(const auto& it : m_headers)
        (((request += it.first) += ": ") += it.second) += "\r\n";

    request += "\r\n";
    request += m_body;

    return request;
}

std::optional<size_t> request::expected_size(std::string_view partial)
{
    std::optional<size_t> header_end = header_block_end(partial);
    if(!header_end)
        return std::nullopt;

    header_map headers;
    size_t endl = partial.find("\r\n");
    parse_headers(partial, endl + 2, headers);

    return *header_end + content_length(headers).value_or(0);
}

void request::parse_requestline(std::string_view requestline)
{
    size_t first = requestline.find(' ');
    size_t second = (first == std::string_view::npos) ? first : requestline.find(' ', first + 1);
    if(first == std::string_view::npos || second == std::string_view::npos ||
        first == 0 || second == first + 1 || second + 1 >= requestline.size())
        throw std::invalid_argument {"invalid_requestline"};

    m_method = std::string {requestline.substr(0, first)};
    m_resource = std::string {requestline.substr(first + 1, second - first - 1)};
    m_protocol = std::string {requestline.substr(second + 1)};

    if(m_protocol.compare(0, 5, "HTTP/") != 0)
        throw std::invalid_argument {"invalid_protocol"};
}

void request::split_resource()
{
    m_path = m_resource.substr(0, m_resource.find('?'));
}

std::string request::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

void request::set_header(const std::string& key, std::string value)
{
    m_headers.insert_or_assign(key, std::move(value));
}

void request::set_body(std::string body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

} // namespace http
