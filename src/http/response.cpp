#include <fstream>
#include <sstream>
#include <ctime>
#include <charconv>
#include <stdexcept>

#include "http/response.hpp"

namespace http
{

std::string_view get_http_phrase(int status_code)
{
    switch(status_code)
    {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 304: return "Not Modified";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 412: return "Precondition Failed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

static bool is_chunked(const header_map& headers)
{
    auto it = headers.find("Transfer-Encoding");
    return it != headers.end() && it->second.find("chunked") != std::string::npos;
}

// Walks the chunks of body. Returns the number of bytes up to and including the
// last chunk or std::nullopt if not everything arrived yet. Appends the payload to
// dest if given.
static std::optional<size_t> decode_chunked(std::string_view body, std::string* dest)
{
    size_t offset = 0;
    while(true)
    {
        size_t endl = body.find("\r\n", offset);
        if(endl == std::string_view::npos)
            return std::nullopt;

        std::string_view size_line = body.substr(offset, endl - offset);
        size_t ext = size_line.find(';');
        if(ext != std::string_view::npos)
            size_line = size_line.substr(0, ext);

        size_t chunk_size = 0;
        auto res = std::from_chars(size_line.data(), size_line.data() + size_line.size(), chunk_size, 16);
        if(res.ec != std::errc {} || size_line.empty())
            throw std::invalid_argument {"invalid chunk size"};

        offset = endl + 2;
        if(chunk_size == 0)
        {
            // Skip trailers up to the closing empty line
            while(true)
            {
                size_t trailer_end = body.find("\r\n", offset);
                if(trailer_end == std::string_view::npos)
                    return std::nullopt;
                if(trailer_end == offset)
                    return trailer_end + 2;
                offset = trailer_end + 2;
            }
        }

        // offset never passes body.size(), the subtraction can not wrap
        if(body.size() - offset < 2 || chunk_size > body.size() - offset - 2)
            return std::nullopt;

        if(dest)
            dest->append(body.data() + offset, chunk_size);
        offset += chunk_size + 2;
    }
}

static size_t parse_statusline(std::string_view raw, int& code, std::string& phrase)
{
    size_t endl = raw.find("\r\n");
    if(endl == std::string_view::npos)
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view line = raw.substr(0, endl);
    size_t first = line.find(' ');
    if(line.compare(0, 5, "HTTP/") != 0 || first == std::string_view::npos)
        throw std::invalid_argument {"invalid_statusline"};

    std::string_view rest = line.substr(first + 1);
    auto res = std::from_chars(rest.data(), rest.data() + rest.size(), code);
    if(res.ec != std::errc {} || code < 100 || code > 999)
        throw std::invalid_argument {"invalid_status_code"};

    size_t second = rest.find(' ');
    phrase = (second == std::string_view::npos) ? std::string {} : std::string {rest.substr(second + 1)};

    return endl + 2;
}

response response::parse(std::string_view raw)
{
    response res;
    size_t offset = parse_statusline(raw, res.m_code, res.m_phrase);
    offset = parse_headers(raw, offset, res.m_headers);

    std::string_view body = raw.substr(offset);
    if(is_chunked(res.m_headers))
    {
        if(!decode_chunked(body, &res.m_body))
            throw std::invalid_argument {"incomplete chunked body"};
    }
    else if(std::optional<size_t> length = content_length(res.m_headers))
    {
        if(body.size() < *length)
            throw std::invalid_argument {"incomplete body"};
        res.m_body = std::string {body.substr(0, *length)};
    }
    else
    {
        res.m_body = std::string {body};
    }

    return res;
}

std::optional<size_t> response::complete_size(std::string_view partial)
{
    std::optional<size_t> header_end = header_block_end(partial);
    if(!header_end)
        return std::nullopt;

    int code;
    std::string phrase;
    header_map headers;
    size_t offset = parse_statusline(partial, code, phrase);
    parse_headers(partial, offset, headers);

    // These never carry a body
    if(code == 204 || code == 304 || (code >= 100 && code < 200))
        return *header_end;

    if(is_chunked(headers))
    {
        std::optional<size_t> chunks = decode_chunked(partial.substr(*header_end), nullptr);
        if(!chunks)
            return std::nullopt;
        return *header_end + *chunks;
    }

    if(std::optional<size_t> length = content_length(headers))
    {
        if(partial.size() < *header_end + *length)
            return std::nullopt;
        return *header_end + *length;
    }

    return std::nullopt;
}

std::string response::to_string() const
{
    std::string response;

    std::time_t now = std::time(nullptr);
    std::tm tm_now;
    gmtime_r(&now, &tm_now);
    char date[64];
    std::strftime(date, sizeof(date), "%a, %d %b %Y %H:%M:%S GMT", &tm_now);

    /* Begin with response line */
    response.append("HTTP/1.1 " + std::to_string(m_code) + " ");
    response.append(m_phrase.empty() ? std::string {get_http_phrase(m_code)} : m_phrase);
    response.append("\r\nDate: ");
    response.append(date);
    response.append("\r\n");

    if(m_headers.find("Content-Type") == m_headers.end())
        response.append("Content-Type: text/html; charset=UTF-8\r\n");
    if(m_headers.find("Content-Length") == m_headers.end())
        response.append("Content-Length: " + std::to_string(m_body.size()) + "\r\n");

    /* Append all headers to response */
    for(const auto& it : m_headers)
        response.append(it.first + ": " + it.second + "\r\n");

    /* Append body to response line */
    response.append("\r\n");
    response.append(m_body);

    return response;
}

void response::set_body_from_file(const std::string& body_file)
{
    if(body_file.find("..") != std::string::npos)
        throw std::invalid_argument {"Path contains not allowed characters"};

    std::ifstream ifs {body_file, std::ios::binary};
    if(!ifs.good())
        throw std::invalid_argument {"Requested file not found"};

    std::stringstream sstr;
    sstr << ifs.rdbuf();
    this->set_body(sstr.str());
}

void response::set_body(const std::string& body)
{
    m_body = body;
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_body(std::string&& body)
{
    m_body = std::move(body);
    set_header("Content-Length", std::to_string(m_body.size()));
}

void response::set_header(const std::string& key, const std::string& value)
{
    m_headers[key] = value;
}

void response::set_header(const std::string& key, std::string&& value)
{
    m_headers[key] = std::move(value);
}

std::string response::get_header(const std::string& key) const
{
    auto it = m_headers.find(key);
    return (it != m_headers.end()) ? it->second : std::string {};
}

} // namespace http
