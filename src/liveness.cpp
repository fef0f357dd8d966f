#include "wire_cpp/connection/liveness.hpp"

#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <memory>
#include <utility>

#include "wire_cpp/log.hpp"

namespace wire_cpp {

    namespace net = boost::asio;
    using tcp = net::ip::tcp;

    namespace {
        /// Shared between the peek and its watchdog. Both run on the same
        /// strand, so once `done` is set a late timer callback never
        /// touches the socket.
        struct ProbeWatch {
            explicit ProbeWatch(net::any_io_executor ex) : timer(std::move(ex)) {}

            net::steady_timer timer;
            bool done{false};
            bool fired{false};
        };

        net::awaitable<ProbeOutcome> probe_on_strand(
            tcp::socket& sock, std::chrono::steady_clock::duration timeout) {
            auto strand = co_await net::this_coro::executor;

            auto watch = std::make_shared<ProbeWatch>(strand);
            watch->timer.expires_after(timeout);
            watch->timer.async_wait(
                [watch, &sock](boost::system::error_code const& ec) {
                    if (ec || watch->done) return;
                    watch->fired = true;
                    boost::system::error_code ignored;
                    sock.cancel(ignored);
                });

            std::array<char, 1> byte{};
            boost::system::error_code ec;
            std::size_t n = co_await sock.async_receive(
                net::buffer(byte), tcp::socket::message_peek,
                net::redirect_error(net::use_awaitable, ec));

            watch->done = true;
            watch->timer.cancel();

            auto logger = log::get();
            if (watch->fired && ec == net::error::operation_aborted) {
                logger->trace("probe: timeout, connection still open");
                co_return ProbeOutcome::Idle;
            }
            if (ec == net::error::eof || (!ec && n == 0)) {
                logger->debug("probe: read 0 bytes, peer closed the connection");
                co_return ProbeOutcome::PeerClosed;
            }
            if (ec) {
                logger->debug("probe: unexpected error ({}), treating as closed",
                              ec.message());
                co_return ProbeOutcome::Failed;
            }
            logger->info("probe: {} byte(s) waiting on an idle connection", n);
            co_return ProbeOutcome::UnexpectedData;
        }
    }  // namespace

    net::awaitable<ProbeOutcome> probe_liveness(
        Stream& stream, std::chrono::steady_clock::duration timeout) {
        auto& sock = stream.raw_socket();
        if (!sock.is_open()) co_return ProbeOutcome::Failed;

        co_return co_await net::co_spawn(net::make_strand(sock.get_executor()),
                                         probe_on_strand(sock, timeout),
                                         net::use_awaitable);
    }

}  // namespace wire_cpp
