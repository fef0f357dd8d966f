#include "wire_cpp/connection/transport.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/error.hpp>

#include "wire_cpp/log.hpp"
#include "wire_cpp/tls.hpp"

namespace wire_cpp {

    namespace net = boost::asio;
    namespace ssl = boost::asio::ssl;
    namespace beast = boost::beast;
    using tcp = net::ip::tcp;

    namespace {
        std::string describe(boost::system::error_code const& ec) {
            if (ec == beast::error::timeout) return "timed out";
            return ec.message();
        }
    }  // namespace

    Result<TransportKind> transport_for(UrlComponents const& url) {
        using R = Result<TransportKind>;
        if (url.scheme == "http") return R::ok(TransportKind::Plain);
        if (url.scheme != "https") {
            return R::err(Error::Code::UnsupportedScheme,
                          "scheme " + url.scheme + " is not supported");
        }

        boost::system::error_code ec;
        net::ip::make_address(url.host, ec);
        if (!ec) {
            return R::err(Error::Code::MissingSniHost,
                          "https requires a domain name for SNI, got " +
                              url.host);
        }
        return R::ok(TransportKind::Secure);
    }

    net::awaitable<Result<tcp::endpoint>> resolve_first(
        tcp::resolver& resolver, std::string const& host,
        std::string const& port) {
        using R = Result<tcp::endpoint>;

        boost::system::error_code ec;
        auto results = co_await resolver.async_resolve(
            host, port, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return R::err(Error::Code::ResolveFailed,
                             "resolve " + host + ": " + ec.message());
        }
        if (results.empty()) {
            co_return R::err(Error::Code::ResolveFailed,
                             "resolve " + host + ": no addresses");
        }
        co_return R::ok(results.begin()->endpoint());
    }

    net::awaitable<Result<Stream>> connect_stream(
        net::any_io_executor ex, ssl::context& ssl_ctx,
        UrlComponents const& url, Destination const& dest,
        ClientConfiguration const& cfg) {
        using R = Result<Stream>;
        boost::system::error_code ec;

        if (dest.kind == TransportKind::Plain) {
            Stream::PlainStream s(ex);
            s.expires_after(cfg.connect_timeout);
            co_await s.async_connect(
                dest.address, net::redirect_error(net::use_awaitable, ec));
            s.expires_never();
            if (ec) {
                co_return R::err(Error::Code::ConnectionFailed,
                                 "connect " + dest.to_string() + ": " +
                                     describe(ec));
            }
            co_return R::ok(std::move(s));
        }

        Stream::SecureStream s(ex, ssl_ctx);
        auto& tcp_layer = beast::get_lowest_layer(s);
        tcp_layer.expires_after(cfg.connect_timeout);

        co_await tcp_layer.async_connect(
            dest.address, net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return R::err(Error::Code::ConnectionFailed,
                             "connect " + dest.to_string() + ": " +
                                 describe(ec));
        }

        if (!set_sni(s, url.host, ec)) {
            co_return R::err(Error::Code::TlsHandshakeFailed,
                             "set SNI " + url.host + ": " + ec.message());
        }
        if (cfg.verify_tls) {
            s.set_verify_callback(ssl::host_name_verification(url.host));
        }

        co_await s.async_handshake(ssl::stream_base::client,
                                   net::redirect_error(net::use_awaitable, ec));
        tcp_layer.expires_never();
        if (ec) {
            co_return R::err(Error::Code::TlsHandshakeFailed,
                             "TLS handshake with " + url.host + ": " +
                                 describe(ec));
        }
        co_return R::ok(std::move(s));
    }

    net::awaitable<Result<Stream>> acquire_stream(
        ConnectionPool& pool, net::any_io_executor ex, ssl::context& ssl_ctx,
        UrlComponents const& url, Destination const& dest,
        ClientConfiguration const& cfg) {
        if (auto pooled = co_await pool.acquire(dest)) {
            co_return Result<Stream>::ok(std::move(*pooled));
        }
        log::get()->trace("opening new {} connection to {}",
                          to_string(dest.kind), dest.to_string());
        co_return co_await connect_stream(std::move(ex), ssl_ctx, url, dest,
                                          cfg);
    }

}  // namespace wire_cpp
