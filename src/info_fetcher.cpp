#include "info_fetcher.hpp"

#include <vector>

#include <rapidxml/rapidxml.hpp>

using namespace rapidxml;

namespace discovery
{

static const char* unknown = "Unknown";

std::string_view to_string(probe_status status)
{
    switch(status)
    {
        case probe_status::found: return "found";
        case probe_status::no_match: return "no match";
        case probe_status::unreachable: return "unreachable";
        case probe_status::error: return "error";
    }
    return "error";
}

// Depth first, the descriptor does not guarantee where the elements are nested
static xml_node<char>* find_element(xml_node<char>* node, const char* name)
{
    for(xml_node<char>* child = node->first_node(); child; child = child->next_sibling())
    {
        if(child->type() != node_element)
            continue;
        if(std::string_view {child->name(), child->name_size()} == name)
            return child;
        if(xml_node<char>* found = find_element(child, name))
            return found;
    }
    return nullptr;
}

static xml_attribute<char>* find_attribute(xml_node<char>* node, const char* name)
{
    for(xml_node<char>* child = node->first_node(); child; child = child->next_sibling())
    {
        if(child->type() != node_element)
            continue;
        if(xml_attribute<char>* attr = child->first_attribute(name))
            return attr;
        if(xml_attribute<char>* found = find_attribute(child, name))
            return found;
    }
    return nullptr;
}

static std::string element_text(xml_node<char>* node)
{
    if(node == nullptr)
        return {};
    return std::string {node->value(), node->value_size()};
}

std::optional<soundtouch::device> parse_info(std::string_view body, const std::string& ip)
{
    // rapidxml parses in place and needs a terminated buffer
    std::vector<char> buffer(body.begin(), body.end());
    buffer.push_back('\0');

    xml_document<char> doc;
    try {
        doc.parse<parse_validate_closing_tags>(buffer.data());
    } catch(rapidxml::parse_error&) {
        return std::nullopt;
    }

    std::string name = element_text(find_element(&doc, "name"));
    if(name.empty())
        return std::nullopt;

    std::string type = element_text(find_element(&doc, "type"));
    xml_attribute<char>* id_attr = find_attribute(&doc, "deviceID");
    std::string device_id = (id_attr != nullptr && id_attr->value_size() > 0) ?
        std::string {id_attr->value(), id_attr->value_size()} : std::string {};

    return soundtouch::device {
        ip,
        std::move(name),
        type.empty() ? unknown : std::move(type),
        device_id.empty() ? unknown : std::move(device_id)
    };
}

probe_result info_fetcher::probe(const std::string& ip, std::chrono::milliseconds timeout) const
{
    try {
        http::response res = m_client.send(ip, m_port, http::request {"GET", "/info"}, timeout);
        if(res.get_code() < 200 || res.get_code() >= 300)
            return {probe_status::no_match, std::nullopt, "HTTP " + std::to_string(res.get_code())};

        std::optional<soundtouch::device> dev = parse_info(res.get_body(), ip);
        if(!dev)
            return {probe_status::no_match, std::nullopt, "descriptor without name"};

        return {probe_status::found, std::move(dev), {}};
    } catch(http::connection_error& e) {
        return {probe_status::unreachable, std::nullopt, e.what()};
    } catch(std::exception& e) {
        return {probe_status::error, std::nullopt, e.what()};
    }
}

} // namespace discovery
