#include "wire_cpp/connection/stream.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <type_traits>

namespace wire_cpp {

    namespace net = boost::asio;
    namespace beast = boost::beast;

    Stream::Stream(PlainStream&& plain)
        : m_stream(std::in_place_type<PlainStream>, std::move(plain)) {}

    Stream::Stream(SecureStream&& secure)
        : m_stream(std::in_place_type<SecureStream>, std::move(secure)) {}

    Stream::Stream(Stream&& other)
        : m_stream(std::move(other.m_stream)),
          m_moved_from(other.m_moved_from) {
        other.m_moved_from = true;
    }

    Stream::~Stream() noexcept { close(); }

    TransportKind Stream::kind() const noexcept {
        return std::holds_alternative<SecureStream>(m_stream)
                   ? TransportKind::Secure
                   : TransportKind::Plain;
    }

    beast::tcp_stream& Stream::lowest_layer() noexcept {
        return std::visit(
            [](auto& s) -> beast::tcp_stream& {
                return beast::get_lowest_layer(s);
            },
            m_stream);
    }

    Stream::tcp::socket& Stream::raw_socket() noexcept {
        return lowest_layer().socket();
    }

    bool Stream::is_open() const noexcept {
        if (m_moved_from) return false;
        return std::visit(
            [](auto const& s) -> bool {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, PlainStream>) {
                    return s.socket().is_open();
                } else {
                    return s.next_layer().socket().is_open();
                }
            },
            m_stream);
    }

    void Stream::expires_after(std::chrono::steady_clock::duration d) {
        lowest_layer().expires_after(d);
    }

    void Stream::expires_never() { lowest_layer().expires_never(); }

    net::awaitable<std::size_t> Stream::read_some(
        net::mutable_buffer buf, boost::system::error_code& ec) {
        ec.clear();
        std::size_t n = co_await std::visit(
            [&](auto& s) {
                return s.async_read_some(
                    buf, net::redirect_error(net::use_awaitable, ec));
            },
            m_stream);

        // Both an orderly TCP close and a TLS peer that drops the socket
        // without close_notify mean "no more bytes".
        if (ec == net::error::eof || ec == net::ssl::error::stream_truncated) {
            ec.clear();
            co_return 0;
        }
        co_return n;
    }

    net::awaitable<void> Stream::write_all(net::const_buffer buf,
                                           boost::system::error_code& ec) {
        ec.clear();
        co_await std::visit(
            [&](auto& s) {
                return net::async_write(
                    s, buf, net::redirect_error(net::use_awaitable, ec));
            },
            m_stream);
    }

    void Stream::close() noexcept {
        if (m_moved_from) return;
        boost::system::error_code ec;
        auto& sock = raw_socket();
        if (!sock.is_open()) return;

        sock.shutdown(tcp::socket::shutdown_both, ec);
        sock.close(ec);
    }

}  // namespace wire_cpp
