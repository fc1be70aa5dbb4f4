// Sluice Backend Address - Header
// Parsed http:// backend base URL (the registry's backend_address)

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sluice::core {

/// Backend base URL split into the parts an HTTP client needs
struct BackendAddress {
    std::string host;
    uint16_t port = 80;
    std::string base_path;  // No trailing '/', empty for root

    /// "http://host:port" (client origin)
    [[nodiscard]] std::string origin() const;

    /// Join base_path with a request path starting with '/'
    [[nodiscard]] std::string path(std::string_view suffix) const;

    /// Canonical form "http://host:port/base"
    [[nodiscard]] std::string to_string() const;

    bool operator==(const BackendAddress&) const = default;
};

/// Parse "http://host[:port][/base/path][/]"
/// Returns nullopt for other schemes, empty host, bad port, query or fragment.
[[nodiscard]] std::optional<BackendAddress> parse_backend_address(std::string_view url);

}  // namespace sluice::core
