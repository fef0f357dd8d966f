#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "connection/connection_pool.hpp"
#include "connection/destination.hpp"
#include "connection/stream.hpp"
#include "protocol/response_reader.hpp"
#include "result.hpp"

namespace wire_cpp {

    /// @brief Largest single read while draining a response body.
    inline constexpr std::size_t kResponseChunkSize = 8 * 1024;

    /**
     * @brief A parsed response head plus the stream its body is still on.
     *
     * The body can be read once. When the Response goes away (destroyed or
     * overwritten by move-assignment) its stream is handed back to the pool
     * if the body was read, and closed otherwise. A pool that no longer
     * exists is never called back.
     */
    class Response {
       public:
        Response(ResponseHead head, Stream stream, Destination dest,
                 std::weak_ptr<ConnectionPool> pool);

        Response(Response&& other);
        Response& operator=(Response&& other);
        Response(const Response&) = delete;
        Response& operator=(const Response&) = delete;

        ~Response() noexcept;

        std::uint16_t status_code() const noexcept { return m_status; }

        /// @brief True for 2xx status codes.
        bool is_success() const noexcept {
            return m_status >= 200 && m_status < 300;
        }

        HttpVersion version() const noexcept { return m_version; }
        const std::string& reason() const noexcept { return m_reason; }
        const ResponseHeaders& headers() const noexcept { return m_headers; }
        const Destination& destination() const noexcept { return m_dest; }

        /// @brief First value of a header (case-insensitive lookup).
        std::optional<std::string_view> header_one(std::string_view key) const;

        /// @brief All values of a header, in arrival order.
        std::vector<std::string_view> header_all(std::string_view key) const;

        /// @brief Declared Content-Length, when present and numeric.
        std::optional<std::uint64_t> content_length() const;

        bool body_consumed() const noexcept { return m_body_consumed; }

        /// @brief Whether the response still owns its stream.
        bool has_stream() const noexcept { return m_stream.has_value(); }

        /**
         * @brief Read the Content-Length framed body as UTF-8 text.
         *
         * A peer that closes early yields the bytes received so far.
         *
         * @return BodyAlreadyConsumed, UnsupportedFraming (no
         * Content-Length), MissingBodyStream, ReceiveFailed or
         * BodyDecodeFailed (not UTF-8) on failure.
         */
        boost::asio::awaitable<Result<std::string>> body_string();

        /// @brief Same as body_string() without text validation.
        boost::asio::awaitable<Result<std::string>> body_bytes();

       private:
        void return_to_pool_() noexcept;

        HttpVersion m_version;
        std::uint16_t m_status;
        std::string m_reason;
        ResponseHeaders m_headers;
        bool m_body_consumed{false};
        std::optional<Stream> m_stream;
        Destination m_dest;
        std::weak_ptr<ConnectionPool> m_pool;
    };

    /// @brief Whether `bytes` is well-formed UTF-8 (no overlongs,
    /// surrogates or code points above U+10FFFF).
    bool is_valid_utf8(std::string_view bytes) noexcept;

}  // namespace wire_cpp
