#include "mcphub/transport/http_types.hpp"

#include <ada.h>

#include <array>
#include <charconv>

namespace mcphub {

namespace {

struct SchemeInfo {
    std::string_view name;
    std::uint16_t default_port;
};

constexpr std::array<SchemeInfo, 4> kSchemes = {{
    {"http", 80},
    {"https", 443},
    {"ws", 80},
    {"wss", 443},
}};

const SchemeInfo* find_scheme(std::string_view protocol) {
    // ada reports the protocol with its trailing colon
    if (protocol.ends_with(':')) {
        protocol.remove_suffix(1);
    }
    for (const auto& scheme : kSchemes) {
        if (scheme.name == protocol) {
            return &scheme;
        }
    }
    return nullptr;
}

}  // namespace

std::optional<UrlComponents> parse_url(const std::string& url) {
    const auto parsed = ada::parse<ada::url>(url);
    if (!parsed) {
        return std::nullopt;
    }

    const auto* scheme = find_scheme(parsed->get_protocol());
    const auto hostname = parsed->get_hostname();
    if (scheme == nullptr || hostname.empty()) {
        return std::nullopt;
    }

    UrlComponents result;
    result.scheme = std::string(scheme->name);
    result.host = std::string(hostname);
    result.port = scheme->default_port;

    const auto port = parsed->get_port();
    if (port.empty() == false) {
        const auto [end, ec] = std::from_chars(port.data(), port.data() + port.size(), result.port);
        if (ec != std::errc{} || end != port.data() + port.size()) {
            return std::nullopt;
        }
    }

    result.path = std::string(parsed->get_pathname());
    if (result.path.empty()) {
        result.path = "/";
    }
    result.query = std::string(parsed->get_search());
    return result;
}

std::optional<UrlComponents> make_endpoint_url(
    std::string_view scheme,
    const std::string& host,
    std::uint16_t port,
    const std::string& path
) {
    if (host.empty() || port == 0) {
        return std::nullopt;
    }

    std::string url = std::string(scheme) + "://" + host + ":" + std::to_string(port);
    if (path.empty() || path.front() != '/') {
        url += '/';
    }
    url += path;
    return parse_url(url);
}

}  // namespace mcphub
