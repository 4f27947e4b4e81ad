#ifndef HTTP_RESPONSE_HPP
#define HTTP_RESPONSE_HPP

#include <string>
#include <string_view>
#include <optional>

#include "http/message.hpp"

namespace http
{

class response
{
public:

    response() = default;

    explicit response(int code)
        : m_code {code}
    {}

    // Parses a complete response received from a server. Supports bodies delimited by
    // Content-Length, chunked transfer coding or the end of the connection.
    // Throws std::invalid_argument on malformed input.
    static response parse(std::string_view raw);

    // Size of the response once everything announced by its headers arrived.
    // std::nullopt while incomplete or when the body ends with the connection.
    static std::optional<size_t> complete_size(std::string_view partial);

    std::string to_string() const;

    // Throws std::invalid_argument if the file can not be served
    void set_body_from_file(const std::string& body_file);

    void set_header(const std::string& key, const std::string& value);

    void set_header(const std::string& key, std::string&& value);

    std::string get_header(const std::string& key) const;

    void set_code(int code)
    {
        m_code = code;
    }

    void set_code(int code, std::string&& phrase)
    {
        m_code = code; m_phrase = std::move(phrase);
    }

    void set_body(const std::string& body);

    void set_body(std::string&& body);

    int get_code() const
    {
        return m_code;
    }

    const std::string& get_phrase() const
    {
        return m_phrase;
    }

    const std::string& get_body() const
    {
        return m_body;
    }

private:

    int m_code = 200;
    std::string m_phrase;
    std::string m_body;

    header_map m_headers;

};

std::string_view get_http_phrase(int status_code);

} // namespace http

#endif
