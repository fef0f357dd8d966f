#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <string>
#include <string_view>

#include "wire_cpp/connection/stream.hpp"
#include "wire_cpp/request.hpp"
#include "wire_cpp/result.hpp"

namespace wire_cpp {

    /// @brief Only accepted reply to `Expect: 100-continue`.
    inline constexpr std::string_view kContinueResponse =
        "HTTP/1.1 100 Continue\r\n\r\n";

    /// @brief Largest chunk moved from a BodySource to the stream at once.
    inline constexpr std::size_t kBodyChunkSize = 128 * 1024;

    /// @brief Standard base64 (with padding).
    std::string base64_encode(std::string_view in);

    /// @brief `key: value\r\n` for each header. Only the first value of a
    /// multi-valued key is written.
    std::string serialize_header_lines(RequestHeaders const& headers);

    /// @brief Request line, headers and framing lines up to the blank line.
    std::string serialize_request_head(Request const& req);

    /**
     * @brief Send the request head and, when requested, wait for
     * `100 Continue`.
     *
     * The continue reply is read with a single read of up to 1 KiB and must
     * match kContinueResponse exactly.
     *
     * @return SendFailed, ReceiveFailed, ContinueClosed or ContinueMismatch
     * on failure.
     */
    boost::asio::awaitable<Status> write_request_head(Stream& stream,
                                                      Request const& req);

    /**
     * @brief Transfer the request body.
     *
     * A streamed body is moved in chunks of at most kBodyChunkSize, never
     * asking the source for more than the declared length still owed, and
     * stops early when the source runs dry.
     */
    boost::asio::awaitable<Status> write_request_body(Stream& stream,
                                                      Request& req);

}  // namespace wire_cpp
