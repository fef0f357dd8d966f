#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

#include "result.hpp"

namespace wire_cpp {

    /**
     * @brief Pieces of an absolute URL that the transport needs.
     *
     * The scheme is kept verbatim (lowercased) so an unsupported one can be
     * rejected by transport acquisition rather than by the parser.
     */
    struct UrlComponents {
        std::string scheme;
        std::string host;  // brackets stripped from IPv6 literals
        std::string port;  // defaulted from the scheme when absent
        std::string path;  // always starts with '/'
        std::string query;  // without the leading '?'
        bool has_query{false};

        bool https() const noexcept { return scheme == "https"; }

        /// @brief Path plus "?query" when present (fragment never included).
        std::string target() const {
            if (!has_query) return path;
            std::string out;
            out.reserve(path.size() + 1 + query.size());
            out.append(path);
            out.push_back('?');
            out.append(query);
            return out;
        }
    };

    namespace url_utils {

        inline std::string to_lower(std::string_view s) {
            std::string out(s);
            std::transform(out.begin(), out.end(), out.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return out;
        }

        /// @brief Port implied by a scheme, empty when the scheme is unknown.
        inline std::string default_port(std::string_view scheme) {
            if (scheme == "https") return "443";
            if (scheme == "http") return "80";
            return {};
        }

        inline bool is_valid_scheme(std::string_view s) {
            if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0])))
                return false;
            return std::all_of(s.begin(), s.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '+' || c == '-' || c == '.';
            });
        }

        inline bool is_valid_port(std::string_view s) {
            if (s.empty() || s.size() > 5) return false;
            if (!std::all_of(s.begin(), s.end(), [](unsigned char c) {
                    return std::isdigit(c);
                }))
                return false;
            return std::stoul(std::string(s)) <= 65535;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute URL (`scheme://host[:port][/path][?query]`).
    /// @return UrlComponents, or Error::Code::InvalidUrl.
    /// @note A `#fragment` is accepted and dropped.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(
                Error::Code::InvalidUrl,
                std::move(msg) + ": " + std::string(url));
        };

        auto scheme_end = url.find("://");
        if (scheme_end == std::string_view::npos) {
            return make_err("URL must start with scheme://");
        }
        std::string_view scheme = url.substr(0, scheme_end);
        if (!url_utils::is_valid_scheme(scheme)) {
            return make_err("URL has an invalid scheme");
        }

        std::string_view s = url.substr(scheme_end + 3);

        // Drop the fragment before anything else.
        if (auto hash = s.find('#'); hash != std::string_view::npos) {
            s = s.substr(0, hash);
        }

        std::string_view hostport = s;
        std::string_view rest;
        if (auto cut = s.find_first_of("/?"); cut != std::string_view::npos) {
            hostport = s.substr(0, cut);
            rest = s.substr(cut);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }
        if (hostport.find('@') != std::string_view::npos) {
            return make_err("URL user info is not supported");
        }

        UrlComponents out;
        out.scheme = url_utils::to_lower(scheme);

        std::string_view host;
        std::string_view port;
        if (hostport.front() == '[') {
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has an unterminated IPv6 literal");
            }
            host = hostport.substr(1, close - 1);
            auto after = hostport.substr(close + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return make_err("URL has garbage after IPv6 literal");
                }
                port = after.substr(1);
                if (port.empty()) return make_err("URL has empty port");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
            if (port.empty()) return make_err("URL has empty port");
        } else {
            host = hostport;
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        if (!port.empty()) {
            if (!url_utils::is_valid_port(port)) {
                return make_err("URL has an invalid port");
            }
            out.port = std::string(port);
        } else {
            out.port = url_utils::default_port(out.scheme);
        }
        out.host = url_utils::to_lower(host);

        if (auto q = rest.find('?'); q != std::string_view::npos) {
            out.path = std::string(rest.substr(0, q));
            out.query = std::string(rest.substr(q + 1));
            out.has_query = true;
        } else {
            out.path = std::string(rest);
        }
        if (out.path.empty()) out.path = "/";

        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace wire_cpp
