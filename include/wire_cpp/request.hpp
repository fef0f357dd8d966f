#pragma once
#include <cctype>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "body.hpp"
#include "http_method.hpp"
#include "url.hpp"

namespace wire_cpp {

    /// @brief Request headers: key to values in insertion order.
    using RequestHeaders = std::map<std::string, std::vector<std::string>>;

    /// @brief ASCII case-insensitive equality, for header names.
    inline bool iequals(std::string_view a, std::string_view b) noexcept {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (std::tolower(static_cast<unsigned char>(a[i])) !=
                std::tolower(static_cast<unsigned char>(b[i])))
                return false;
        }
        return true;
    }

    /**
     * @brief An outgoing HTTP/1.1 request.
     *
     * Move-only because a streamed body owns its source. Build one with
     * Request::create() and the chained setters.
     */
    struct Request {
        HttpMethod method{HttpMethod::Get};
        std::string url;
        UrlComponents target;
        RequestHeaders headers;
        std::optional<std::pair<std::string, std::string>> basic_auth;
        RequestBody body;
        std::uint64_t content_length{0};
        std::optional<std::chrono::milliseconds> header_timeout;
        bool expect_continue{false};

        /// @brief Parse `url` into a GET request without headers or body.
        /// @return The request, or Error::Code::InvalidUrl.
        static Result<Request> create(std::string_view url,
                                      HttpMethod method = HttpMethod::Get) {
            auto parsed = parse_url(url);
            if (parsed.has_error()) {
                return std::move(parsed).forward_error<Request>();
            }
            Request r;
            r.method = method;
            r.url = std::string(url);
            r.target = std::move(parsed).value();
            return Result<Request>::ok(std::move(r));
        }

        Request& set_method(HttpMethod m) {
            method = m;
            return *this;
        }

        /// @brief Replace every value of `key` with `value`.
        Request& set_header(std::string key, std::string value) {
            headers[std::move(key)] = {std::move(value)};
            return *this;
        }

        /// @brief Append `value` to the values of `key`.
        Request& add_header(std::string key, std::string value) {
            headers[std::move(key)].push_back(std::move(value));
            return *this;
        }

        /// @brief Merge `more` into the headers; keys present in both take
        /// the values from `more`.
        Request& set_headers(RequestHeaders more) {
            for (auto& [k, v] : more) headers[k] = std::move(v);
            return *this;
        }

        /// @brief First value of `key` (case-insensitive), if any.
        std::optional<std::string> header_one(std::string_view key) const {
            for (auto const& [k, v] : headers) {
                if (iequals(k, key) && !v.empty()) return v.front();
            }
            return std::nullopt;
        }

        /// @brief All values of `key` (case-insensitive).
        std::vector<std::string> header_all(std::string_view key) const {
            std::vector<std::string> out;
            for (auto const& [k, v] : headers) {
                if (iequals(k, key)) out.insert(out.end(), v.begin(), v.end());
            }
            return out;
        }

        bool has_header(std::string_view key) const {
            for (auto const& [k, v] : headers) {
                if (iequals(k, key)) return true;
            }
            return false;
        }

        Request& set_basic_auth(std::string user, std::string password) {
            basic_auth.emplace(std::move(user), std::move(password));
            return *this;
        }

        Request& set_expect_continue(bool on = true) {
            expect_continue = on;
            return *this;
        }

        Request& set_content_length(std::uint64_t n) {
            content_length = n;
            return *this;
        }

        Request& set_header_timeout(std::chrono::milliseconds t) {
            header_timeout = t;
            return *this;
        }

        /// @brief Literal body; Content-Length follows its size.
        Request& set_body_string(std::string data) {
            content_length = data.size();
            body = std::move(data);
            return *this;
        }

        /// @brief Streamed body of exactly `length` declared bytes.
        Request& set_body_stream(std::unique_ptr<BodySource> source,
                                 std::uint64_t length) {
            content_length = length;
            body = std::move(source);
            return *this;
        }

        /// @brief Stream the file at `path`; Content-Length is its size.
        /// @return Error::Code::FileError when the file cannot be opened.
        Status set_body_file(
            std::filesystem::path const& path,
            std::optional<boost::asio::any_io_executor> blocking_executor =
                std::nullopt) {
            auto src = FileBodySource::open(path, std::move(blocking_executor));
            if (src.has_error()) {
                return std::move(src).forward_error<std::monostate>();
            }
            auto file = std::move(src).value();
            auto size = file->size();
            set_body_stream(std::move(file), size);
            return Status::ok();
        }
    };

}  // namespace wire_cpp
