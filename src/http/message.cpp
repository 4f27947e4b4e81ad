#include "http/message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace http
{

bool header_less::operator()(const std::string& lhs, const std::string& rhs) const
{
    return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) {
            return std::tolower(a) < std::tolower(b);
        });
}

std::optional<size_t> header_block_end(std::string_view message)
{
    size_t pos = message.find("\r\n\r\n");
    if(pos == std::string_view::npos)
        return std::nullopt;
    return pos + 4;
}

static std::string_view trim(std::string_view view)
{
    while(!view.empty() && (view.front() == ' ' || view.front() == '\t'))
        view.remove_prefix(1);
    while(!view.empty() && (view.back() == ' ' || view.back() == '\t'))
        view.remove_suffix(1);
    return view;
}

size_t parse_headers(std::string_view message, size_t offset, header_map& headers)
{
    while(true)
    {
        size_t endl = message.find("\r\n", offset);
        if(endl == std::string_view::npos)
            throw std::invalid_argument {"unterminated header block"};

        // Empty line ends the header block
        if(endl == offset)
            return endl + 2;

        std::string_view line = message.substr(offset, endl - offset);
        size_t sep = line.find(':');
        if(sep == std::string_view::npos || sep == 0)
            throw std::invalid_argument {"invalid header line"};

        headers.insert_or_assign(std::string {trim(line.substr(0, sep))}, std::string {trim(line.substr(sep + 1))});
        offset = endl + 2;
    }
}

std::optional<size_t> content_length(const header_map& headers)
{
    auto it = headers.find("Content-Length");
    if(it == headers.end())
        return std::nullopt;

    size_t length = 0;
    const std::string& hdr = it->second;
    auto res = std::from_chars(hdr.data(), hdr.data() + hdr.size(), length);
    if(res.ec != std::errc {} || res.ptr != hdr.data() + hdr.size())
        throw std::invalid_argument {"invalid Content-Length"};

    return length;
}

} // namespace http
