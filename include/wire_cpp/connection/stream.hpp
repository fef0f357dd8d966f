#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <variant>

#include "wire_cpp/connection/destination.hpp"

namespace wire_cpp {

    /**
     * @brief An open duplex byte channel, plaintext or TLS.
     *
     * The two transports live in a tagged union; callers only ever see the
     * uniform operations below. raw_socket() reaches under the TLS record
     * layer so the pool can probe the TCP connection itself.
     *
     * Move-only. A Stream is owned by exactly one pipeline stage at a time
     * and closes its socket when destroyed.
     */
    class Stream {
       public:
        using tcp = boost::asio::ip::tcp;
        using PlainStream = boost::beast::tcp_stream;
        using SecureStream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

        explicit Stream(PlainStream&& plain);
        explicit Stream(SecureStream&& secure);

        Stream(Stream&& other);
        Stream& operator=(Stream&&) = delete;
        Stream(const Stream&) = delete;
        Stream& operator=(const Stream&) = delete;

        ~Stream() noexcept;

        TransportKind kind() const noexcept;

        /// @brief The TCP socket under either transport.
        tcp::socket& raw_socket() noexcept;

        /// @brief The Beast TCP layer (owner of the I/O deadline).
        boost::beast::tcp_stream& lowest_layer() noexcept;

        bool is_open() const noexcept;

        /// @brief Arm a deadline covering every read/write started until
        /// expires_never(). Expiry closes the socket and fails the pending
        /// operation with boost::beast::error::timeout.
        void expires_after(std::chrono::steady_clock::duration d);
        void expires_never();

        /// @brief Read at most buffer_size(buf) bytes.
        /// @return Bytes read; 0 with a clear `ec` means the peer closed the
        /// connection (TCP EOF or truncated TLS close).
        boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buf, boost::system::error_code& ec);

        /// @brief Write the whole buffer.
        boost::asio::awaitable<void> write_all(
            boost::asio::const_buffer buf, boost::system::error_code& ec);

        /// @brief Close the TCP socket (best-effort, no TLS shutdown).
        void close() noexcept;

       private:
        std::variant<PlainStream, SecureStream> m_stream;

        /// A moved-from beast::ssl_stream owns no state; nothing may touch it.
        bool m_moved_from{false};
    };

}  // namespace wire_cpp
