#include <gtest/gtest.h>

#include <array>
#include <boost/asio/use_future.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "test_support.hpp"
#include "wire_cpp/connection/connection_pool.hpp"
#include "wire_cpp/connection/liveness.hpp"
#include "wire_cpp/connection/stream.hpp"

using namespace wire_cpp;
using namespace wire_cpp::test;
using namespace std::chrono_literals;

namespace {

    net::awaitable<std::string> read_n(Stream& s, std::size_t n) {
        std::string out(n, '\0');
        std::size_t got = 0;
        boost::system::error_code ec;
        while (got < n) {
            auto k = co_await s.read_some(
                net::buffer(out.data() + got, n - got), ec);
            if (ec || k == 0) break;
            got += k;
        }
        out.resize(got);
        co_return out;
    }

}  // namespace

TEST(StreamTest, PlainStreamBasics) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());
    auto& s = *pair->client;

    EXPECT_EQ(s.kind(), TransportKind::Plain);
    EXPECT_TRUE(s.is_open());
    EXPECT_TRUE(s.raw_socket().is_open());

    s.close();
    EXPECT_FALSE(s.is_open());
}

TEST(StreamTest, MovedFromStreamIsClosedAndSafeToDestroy) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());

    Stream moved(std::move(*pair->client));
    EXPECT_TRUE(moved.is_open());
    EXPECT_FALSE(pair->client->is_open());
    pair->client.reset();
    EXPECT_TRUE(moved.is_open());
}

TEST(StreamTest, WriteAllAndReadSome) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());

    auto ec = await_or_abort(runner.ioc(),
                             [&]() -> net::awaitable<boost::system::error_code> {
                                 boost::system::error_code ec;
                                 co_await pair->client->write_all(
                                     net::buffer(std::string_view("ping")), ec);
                                 co_return ec;
                             });
    EXPECT_FALSE(ec);

    std::array<char, 4> buf{};
    net::read(pair->server, net::buffer(buf));
    EXPECT_EQ(std::string(buf.data(), buf.size()), "ping");

    write_all(pair->server, "pong");
    auto got = await_or_abort(runner.ioc(),
                              [&] { return read_n(*pair->client, 4); });
    EXPECT_EQ(got, "pong");
}

TEST(StreamTest, ReadSomeReportsPeerCloseAsZeroBytes) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());
    pair->server.close();

    auto result = await_or_abort(
        runner.ioc(),
        [&]() -> net::awaitable<std::pair<std::size_t, bool>> {
            std::array<char, 8> buf{};
            boost::system::error_code ec;
            auto n = co_await pair->client->read_some(net::buffer(buf), ec);
            co_return std::make_pair(n, static_cast<bool>(ec));
        });
    EXPECT_EQ(result.first, 0u);
    EXPECT_FALSE(result.second);
}

// ---------------------
// Liveness probe
// ---------------------

TEST(LivenessProbeTest, IdleConnectionIsAlive) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());

    auto outcome = await_or_abort(runner.ioc(), [&] {
        return probe_liveness(*pair->client, 100ms);
    });
    EXPECT_EQ(outcome, ProbeOutcome::Idle);
    EXPECT_TRUE(is_alive(outcome));
    EXPECT_TRUE(pair->client->is_open());
}

TEST(LivenessProbeTest, PendingBytesAreAliveAndNotConsumed) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());
    write_all(pair->server, "x");
    std::this_thread::sleep_for(50ms);

    auto outcome = await_or_abort(runner.ioc(), [&] {
        return probe_liveness(*pair->client, 1000ms);
    });
    EXPECT_EQ(outcome, ProbeOutcome::UnexpectedData);
    EXPECT_TRUE(is_alive(outcome));

    auto got = await_or_abort(runner.ioc(),
                              [&] { return read_n(*pair->client, 1); });
    EXPECT_EQ(got, "x");
}

TEST(LivenessProbeTest, PeerCloseIsDetected) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());
    pair->server.close();
    std::this_thread::sleep_for(50ms);

    auto outcome = await_or_abort(runner.ioc(), [&] {
        return probe_liveness(*pair->client, 1000ms);
    });
    EXPECT_EQ(outcome, ProbeOutcome::PeerClosed);
    EXPECT_FALSE(is_alive(outcome));
}

TEST(LivenessProbeTest, ClosedSocketFails) {
    IoThreadRunner runner;
    auto pair = make_socket_pair(runner.executor());
    pair->client->close();

    auto outcome = await_or_abort(runner.ioc(), [&] {
        return probe_liveness(*pair->client, 100ms);
    });
    EXPECT_EQ(outcome, ProbeOutcome::Failed);
    EXPECT_FALSE(is_alive(outcome));
}

// A zero timeout makes the watchdog timer race the peek on every pass. With
// four threads running the context, a late cancel would abort the read that
// follows reuse.
TEST(LivenessCheckTest, MultiThreadedReuseKeepsStreamUsable) {
    constexpr int kRounds = 300;

    net::io_context ioc(4);
    auto guard = net::make_work_guard(ioc);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) threads.emplace_back([&] { ioc.run(); });

    ConnectionPoolConfiguration cfg;
    cfg.probe_timeout = 0ms;
    ConnectionPool pool(cfg);
    auto pair = make_socket_pair(ioc.get_executor());
    auto dest = pair->destination;

    std::thread server([&] {
        for (int i = 0; i < kRounds; ++i) {
            char byte = 0;
            boost::system::error_code ec;
            net::read(pair->server, net::buffer(&byte, 1), ec);
            if (ec) return;
            write_all(pair->server, "b");
        }
    });

    auto done = net::co_spawn(
        ioc,
        [&]() -> net::awaitable<int> {
            std::optional<Stream> current(std::move(*pair->client));
            int ok = 0;
            for (int i = 0; i < kRounds; ++i) {
                pool.release(dest, std::move(*current));
                current.reset();
                auto reused = co_await pool.acquire(dest);
                if (!reused) break;
                current.emplace(std::move(*reused));

                boost::system::error_code ec;
                co_await current->write_all(net::buffer(std::string_view("p")),
                                           ec);
                if (ec) break;
                char byte = 0;
                auto n = co_await current->read_some(net::buffer(&byte, 1), ec);
                if (ec || n != 1 || byte != 'b') break;
                ++ok;
            }
            if (current) current->close();
            co_return ok;
        },
        net::use_future);

    ASSERT_EQ(done.wait_for(30s), std::future_status::ready);
    EXPECT_EQ(done.get(), kRounds);

    server.join();
    pair->server.close();
    guard.reset();
    ioc.stop();
    for (auto& t : threads) t.join();
}
