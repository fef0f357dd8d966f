#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <string>

#include "wire_cpp/config.hpp"
#include "wire_cpp/connection/connection_pool.hpp"
#include "wire_cpp/connection/destination.hpp"
#include "wire_cpp/connection/stream.hpp"
#include "wire_cpp/result.hpp"
#include "wire_cpp/url.hpp"

namespace wire_cpp {

    /// @brief Transport a URL needs.
    /// @return UnsupportedScheme for anything but http/https, MissingSniHost
    /// for an https URL whose host is an IP literal.
    Result<TransportKind> transport_for(UrlComponents const& url);

    /// @brief Resolve host:port and keep the first address only.
    /// @return ResolveFailed when resolution fails or yields nothing.
    boost::asio::awaitable<Result<boost::asio::ip::tcp::endpoint>>
    resolve_first(boost::asio::ip::tcp::resolver& resolver,
                  std::string const& host, std::string const& port);

    /**
     * @brief Open a new connection to `dest`.
     *
     * Secure destinations get SNI set to `url.host`, host-name verification
     * when `cfg.verify_tls` is on, and a client handshake. `connect_timeout`
     * bounds connect and handshake together.
     *
     * @return ConnectionFailed or TlsHandshakeFailed on failure.
     */
    boost::asio::awaitable<Result<Stream>> connect_stream(
        boost::asio::any_io_executor ex, boost::asio::ssl::context& ssl_ctx,
        UrlComponents const& url, Destination const& dest,
        ClientConfiguration const& cfg);

    /// @brief A live pooled stream for `dest`, or a freshly connected one.
    boost::asio::awaitable<Result<Stream>> acquire_stream(
        ConnectionPool& pool, boost::asio::any_io_executor ex,
        boost::asio::ssl::context& ssl_ctx, UrlComponents const& url,
        Destination const& dest, ClientConfiguration const& cfg);

}  // namespace wire_cpp
