#pragma once
#include <boost/beast/http/verb.hpp>
#include <string_view>

namespace wire_cpp {
    namespace http = boost::beast::http;

    enum class HttpMethod {
        Get,
        Post,
        Put,
        Patch,
        Delete,
        Head,
        Options,
    };

    inline constexpr http::verb to_boost_http_method(HttpMethod method) {
        switch (method) {
            case HttpMethod::Get:
                return http::verb::get;
            case HttpMethod::Post:
                return http::verb::post;
            case HttpMethod::Put:
                return http::verb::put;
            case HttpMethod::Patch:
                return http::verb::patch;
            case HttpMethod::Delete:
                return http::verb::delete_;
            case HttpMethod::Head:
                return http::verb::head;
            case HttpMethod::Options:
                return http::verb::options;
            default:
                return http::verb::unknown;
        }
    }

    /// @brief Request-line token of a method ("GET", "POST", ...).
    /// @return Empty view for values outside the enum.
    inline std::string_view method_token(HttpMethod method) {
        const http::verb v = to_boost_http_method(method);
        if (v == http::verb::unknown) return {};
        auto tok = http::to_string(v);
        return std::string_view(tok.data(), tok.size());
    }

}  // namespace wire_cpp
