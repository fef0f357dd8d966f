#include "wire_cpp/client.hpp"

#include <stdexcept>

#include "wire_cpp/connection/transport.hpp"
#include "wire_cpp/log.hpp"
#include "wire_cpp/protocol/request_writer.hpp"
#include "wire_cpp/protocol/response_reader.hpp"
#include "wire_cpp/tls.hpp"
#include "wire_cpp/url.hpp"

namespace net = boost::asio;

namespace wire_cpp {

    namespace {
        net::ssl::context make_tls_context_or_throw(
            ClientConfiguration const& cfg) {
            auto ctx = make_tls_context(cfg.trust_store, cfg.verify_tls);
            if (ctx.has_error()) {
                throw std::runtime_error("Invalid trust store: " +
                                         ctx.error().message);
            }
            return std::move(ctx).value();
        }
    }  // namespace

    Client::Client(net::any_io_executor ex, ClientConfiguration cfg)
        : cfg_(std::move(cfg)),
          ex_(std::move(ex)),
          resolver_(ex_),
          ssl_ctx_(make_tls_context_or_throw(cfg_)),
          pool_(std::make_shared<ConnectionPool>(cfg_.pool_config)) {}

    void Client::add_default_headers_(Request& req) const {
        if (!req.has_header("host")) {
            auto const& u = req.target;
            std::string host = u.host.find(':') != std::string::npos
                                   ? "[" + u.host + "]"
                                   : u.host;
            if (u.port != url_utils::default_port(u.scheme)) {
                host += ":" + u.port;
            }
            req.set_header("host", std::move(host));
        }
        if (!req.has_header("user-agent")) {
            req.set_header("user-agent", cfg_.user_agent);
        }
    }

    net::awaitable<Result<PendingRequest>> Client::send_head(Request& req) {
        using R = Result<PendingRequest>;

        auto kind = transport_for(req.target);
        if (kind.has_error()) {
            co_return std::move(kind).forward_error<PendingRequest>();
        }

        auto address =
            co_await resolve_first(resolver_, req.target.host, req.target.port);
        if (address.has_error()) {
            co_return std::move(address).forward_error<PendingRequest>();
        }
        Destination dest{address.value(), kind.value()};

        auto stream = co_await acquire_stream(*pool_, ex_, ssl_ctx_,
                                              req.target, dest, cfg_);
        if (stream.has_error()) {
            co_return std::move(stream).forward_error<PendingRequest>();
        }

        add_default_headers_(req);
        auto sent = co_await write_request_head(stream.value(), req);
        if (sent.has_error()) {
            co_return std::move(sent).forward_error<PendingRequest>();
        }

        co_return R::ok(PendingRequest{std::move(stream).value(), dest});
    }

    net::awaitable<Result<Response>> Client::send_body(Request& req,
                                                       PendingRequest pending) {
        using R = Result<Response>;

        auto sent = co_await write_request_body(pending.stream, req);
        if (sent.has_error()) {
            co_return std::move(sent).forward_error<Response>();
        }

        auto timeout = req.header_timeout ? req.header_timeout
                                          : cfg_.header_timeout;
        auto head = co_await read_response_head(pending.stream, timeout,
                                                cfg_.max_header_bytes);
        if (head.has_error()) {
            co_return std::move(head).forward_error<Response>();
        }

        co_return R::ok(std::move(head).value(), std::move(pending.stream),
                        pending.destination,
                        std::weak_ptr<ConnectionPool>(pool_));
    }

    net::awaitable<Result<Response>> Client::send(Request& req) {
        auto pending = co_await send_head(req);
        if (pending.has_error()) {
            co_return std::move(pending).forward_error<Response>();
        }
        co_return co_await send_body(req, std::move(pending).value());
    }

    net::awaitable<Result<Response>> Client::get(std::string url) {
        auto req = Request::create(url, HttpMethod::Get);
        if (req.has_error()) {
            co_return std::move(req).forward_error<Response>();
        }
        co_return co_await send(req.value());
    }

    net::awaitable<Result<Response>> Client::post(std::string url,
                                                  std::string body) {
        auto req = Request::create(url, HttpMethod::Post);
        if (req.has_error()) {
            co_return std::move(req).forward_error<Response>();
        }
        req.value().set_body_string(std::move(body));
        co_return co_await send(req.value());
    }

}  // namespace wire_cpp
