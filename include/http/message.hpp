#ifndef HTTP_MESSAGE_HPP
#define HTTP_MESSAGE_HPP

#include <string>
#include <string_view>
#include <map>
#include <optional>

namespace http
{

// Header names are case insensitive
struct header_less
{
    bool operator()(const std::string& lhs, const std::string& rhs) const;
};

using header_map = std::map<std::string, std::string, header_less>;

// Offset of the first byte after the "\r\n\r\n" that ends the header block
std::optional<size_t> header_block_end(std::string_view message);

// Reads "Key: value" lines starting at offset up to the empty line. Returns the
// offset of the body. Throws std::invalid_argument on a malformed line.
size_t parse_headers(std::string_view message, size_t offset, header_map& headers);

// Value of Content-Length, std::nullopt if not present. Throws std::invalid_argument
// if the value is not a number.
std::optional<size_t> content_length(const header_map& headers);

} // namespace http

#endif
