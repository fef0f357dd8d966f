#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "wire_cpp/connection/stream.hpp"
#include "wire_cpp/result.hpp"

namespace wire_cpp {

    enum class HttpVersion { Http10, Http11 };

    inline const char* to_string(HttpVersion v) {
        return v == HttpVersion::Http10 ? "HTTP/1.0" : "HTTP/1.1";
    }

    /// @brief Response headers: lowercased key to values in arrival order.
    using ResponseHeaders =
        std::unordered_map<std::string, std::vector<std::string>>;

    struct StatusLine {
        HttpVersion version{HttpVersion::Http11};
        std::uint16_t status{0};
        std::string reason;
    };

    struct HeaderLine {
        std::string_view key;
        std::string_view value;
    };

    struct ResponseHead {
        StatusLine status_line;
        ResponseHeaders headers;
    };

    /// @brief Default cap on status line plus header block.
    inline constexpr std::size_t kDefaultMaxHeadBytes = 64 * 1024;

    /**
     * @brief Read one byte at a time until the bytes read end with
     * `delimiter`.
     *
     * Nothing past the delimiter is consumed, so the body stays on the
     * stream.
     *
     * @return The bytes including the delimiter. ReceiveFailed when the peer
     * closes first or the read fails, HeaderTimeout when the stream deadline
     * expires, MalformedHeader when `max_bytes` arrive without the delimiter.
     */
    boost::asio::awaitable<Result<std::string>> read_until(
        Stream& stream, std::string_view delimiter,
        std::size_t max_bytes = kDefaultMaxHeadBytes);

    /// @brief Parse `HTTP/<version> <code>[ <reason>]\r\n`.
    /// @return MalformedStatusLine, InvalidHttpVersion or InvalidStatusCode
    /// on failure.
    Result<StatusLine> parse_status_line(std::string_view line);

    /// @brief Parse one `key: value\r\n` line at the front of `input`.
    /// @return The line and the unparsed rest, or MalformedHeader.
    Result<std::pair<HeaderLine, std::string_view>> parse_header_line(
        std::string_view input);

    /// @brief Parse header lines up to the terminating lone `\r\n`.
    /// Keys are lowercased; repeated keys accumulate values.
    Result<ResponseHeaders> parse_header_block(std::string_view block);

    /**
     * @brief Read and parse the status line and header block.
     * @param header_timeout Bounds the status-line read when set.
     * @param max_head_bytes Cap on status line and header block together;
     * a longer head fails with MalformedHeader.
     */
    boost::asio::awaitable<Result<ResponseHead>> read_response_head(
        Stream& stream,
        std::optional<std::chrono::milliseconds> header_timeout,
        std::size_t max_head_bytes = kDefaultMaxHeadBytes);

}  // namespace wire_cpp
