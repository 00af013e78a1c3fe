#pragma once

#include "mcphub/transport.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace mcphub {

// ─────────────────────────────────────────────────────────────────────────────
// Endpoint URLs
// ─────────────────────────────────────────────────────────────────────────────
// Remote servers are addressed by http(s) or ws URLs. Parsing goes through
// ada-url, so IDN hosts, IPv6 literals and percent encoding are normalized
// before a transport sees them.

struct UrlComponents {
    std::string scheme;   // "http", "https", "ws" or "wss"
    std::string host;
    std::uint16_t port{0};  // explicit port or the scheme default
    std::string path;     // always starts with '/'
    std::string query;    // "?a=b" or empty

    [[nodiscard]] bool is_secure() const {
        return scheme == "https" || scheme == "wss";
    }

    /// scheme://host:port
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    /// origin() + path + query
    [[nodiscard]] std::string full() const {
        return origin() + path + query;
    }
};

/// Nullopt for anything that is not an http, https, ws or wss URL with a host
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

/// Assemble scheme://host:port/path from descriptor fields and validate it
[[nodiscard]] std::optional<UrlComponents> make_endpoint_url(
    std::string_view scheme,
    const std::string& host,
    std::uint16_t port,
    const std::string& path
);

}  // namespace mcphub
