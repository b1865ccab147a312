#pragma once

/// @file transport_config.hpp
/// @brief Transport configuration and API URL parsing

#include <charconv>
#include <chrono>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace courier::net {

/// Parsed Bot API server URL
struct api_url {
    std::string scheme;     ///< http or https
    std::string host;       ///< hostname
    uint16_t port = 0;      ///< port (0 = default)
    std::string path;       ///< path prefix without trailing /

    /// Get effective port
    uint16_t effective_port() const {
        return port != 0 ? port : default_port();
    }

    /// Get default port for scheme
    uint16_t default_port() const {
        return is_secure() ? 443 : 80;
    }

    /// Check if HTTPS
    bool is_secure() const {
        return scheme == "https";
    }

    /// Value for the Host header
    std::string authority() const {
        if (port != 0 && port != default_port()) {
            return host + ":" + std::to_string(port);
        }
        return host;
    }

    /// Parse URL from string; only http and https are accepted
    static std::optional<api_url> parse(std::string_view str) {
        api_url result;

        auto scheme_end = str.find("://");
        if (scheme_end == std::string_view::npos) {
            return std::nullopt;
        }
        result.scheme = str.substr(0, scheme_end);
        str = str.substr(scheme_end + 3);

        for (char& c : result.scheme) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        if (result.scheme != "http" && result.scheme != "https") {
            return std::nullopt;
        }

        auto path_pos = str.find('/');
        if (path_pos != std::string_view::npos) {
            result.path = str.substr(path_pos);
            str = str.substr(0, path_pos);
            while (!result.path.empty() && result.path.back() == '/') {
                result.path.pop_back();
            }
        }

        auto colon_pos = str.rfind(':');
        if (colon_pos != std::string_view::npos) {
            result.host = str.substr(0, colon_pos);
            auto port_str = str.substr(colon_pos + 1);
            uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
            if (ec != std::errc{} || ptr != port_str.data() + port_str.size()) {
                return std::nullopt;
            }
            result.port = port;
        } else {
            result.host = str;
        }

        if (result.host.empty()) {
            return std::nullopt;
        }

        return result;
    }
};

/// Transport configuration
struct transport_config {
    std::string token;                                  ///< Bot token (secret)
    std::string api_url = "https://api.telegram.org";   ///< Bot API server
    std::chrono::seconds connect_timeout{10};           ///< Connection timeout
    std::chrono::seconds request_timeout{30};           ///< Whole-call timeout
    std::string user_agent = "courier/0.1";             ///< User-Agent header
    bool verify_certificate = true;                     ///< Verify TLS certificates

    /// Build a configuration from the environment
    ///
    /// Reads `COURIER_TOKEN` (required) and `COURIER_API_URL` (optional).
    /// @throws std::runtime_error if `COURIER_TOKEN` is not set
    static transport_config from_env() {
        transport_config config;
        const char* token = std::getenv("COURIER_TOKEN");
        if (!token || !*token) {
            throw std::runtime_error("COURIER_TOKEN is not set");
        }
        config.token = token;
        if (const char* url = std::getenv("COURIER_API_URL"); url && *url) {
            config.api_url = url;
        }
        return config;
    }
};

} // namespace courier::net
