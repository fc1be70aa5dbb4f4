// Sluice Backend Address - Implementation

#include "url.hpp"

#include <fmt/format.h>

#include <charconv>

namespace sluice::core {

std::string BackendAddress::origin() const {
    return fmt::format("http://{}:{}", host, port);
}

std::string BackendAddress::path(std::string_view suffix) const {
    std::string full = base_path;
    full.append(suffix);
    if (full.empty()) {
        full = "/";
    }
    return full;
}

std::string BackendAddress::to_string() const {
    return origin() + base_path;
}

std::optional<BackendAddress> parse_backend_address(std::string_view url) {
    constexpr std::string_view scheme = "http://";
    if (url.size() <= scheme.size() || url.substr(0, scheme.size()) != scheme) {
        return std::nullopt;
    }

    std::string_view rest = url.substr(scheme.size());
    if (rest.find_first_of("?#") != std::string_view::npos) {
        return std::nullopt;
    }

    size_t slash = rest.find('/');
    std::string_view host_port = slash == std::string_view::npos ? rest : rest.substr(0, slash);
    std::string_view path = slash == std::string_view::npos ? std::string_view{} : rest.substr(slash);

    BackendAddress address;

    size_t colon = host_port.rfind(':');
    if (colon != std::string_view::npos) {
        std::string_view port_str = host_port.substr(colon + 1);
        if (port_str.empty()) {
            return std::nullopt;
        }

        unsigned int port = 0;
        auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
        if (ec != std::errc{} || ptr != port_str.data() + port_str.size() || port == 0 ||
            port > 65535) {
            return std::nullopt;
        }
        address.port = static_cast<uint16_t>(port);
        host_port = host_port.substr(0, colon);
    }

    if (host_port.empty() || host_port.find_first_of(" @") != std::string_view::npos) {
        return std::nullopt;
    }
    address.host = std::string(host_port);

    // Strip trailing slashes ("http://h/api/" and "http://h/api" are the same backend)
    while (!path.empty() && path.back() == '/') {
        path.remove_suffix(1);
    }
    address.base_path = std::string(path);

    return address;
}

}  // namespace sluice::core
