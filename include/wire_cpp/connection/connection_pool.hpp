#pragma once

#include <utility>
#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "wire_cpp/config.hpp"
#include "wire_cpp/connection/destination.hpp"
#include "wire_cpp/connection/stream.hpp"

namespace wire_cpp {

    /// @brief Metrics for monitoring connection pool behavior
    struct ConnectionPoolMetrics {
        // Gauges (current state)
        std::atomic<std::size_t> total_idle{0};  ///< Currently idle

        // Counters (cumulative)
        std::atomic<std::uint64_t> acquire_hit{0};   ///< Idle stream popped
        std::atomic<std::uint64_t> acquire_miss{0};  ///< Bucket empty
        std::atomic<std::uint64_t> connection_reused{0};  ///< Probe said alive
        std::atomic<std::uint64_t> connection_dropped_unhealthy{
            0};                                      ///< Probe said dead
        std::atomic<std::uint64_t> released{0};      ///< Stream kept idle
        std::atomic<std::uint64_t> release_overflow{0};  ///< Bucket full
    };

    /**
     * @brief Idle keep-alive streams, bucketed by Destination.
     *
     * Buckets are LIFO stacks spread over independently locked shards, so
     * requests to different destinations rarely contend. A bucket is
     * created on first release and holds at most
     * ConnectionPoolConfiguration::max_idle_per_destination streams.
     *
     * Streams are probed for liveness when taken out, never while idle.
     */
    class ConnectionPool {
       public:
        explicit ConnectionPool(ConnectionPoolConfiguration cfg = {});

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        /**
         * @brief Take the most recently released stream for `dest` and
         * probe it.
         * @return The stream if it looks alive; std::nullopt when the bucket
         * is empty or the single candidate turned out dead (it is closed).
         */
        boost::asio::awaitable<std::optional<Stream>> acquire(Destination dest);

        /// @brief Pop the top idle stream without probing it.
        std::optional<Stream> try_pop(Destination const& dest);

        /// @brief Keep `stream` idle for `dest`, or close it when the bucket
        /// is full.
        void release(Destination const& dest, Stream stream) noexcept;

        std::size_t idle_count(Destination const& dest) const;
        std::size_t total_idle() const;

        /// @brief Close every idle stream.
        void clear();

        ConnectionPoolConfiguration const& config() const noexcept {
            return cfg_;
        }

        const ConnectionPoolMetrics& metrics() const noexcept {
            return metrics_;
        }

       private:
        struct Bucket {
            std::vector<Stream> streams;
        };

        struct Shard {
            mutable std::mutex mu;
            std::unordered_map<Destination, Bucket> buckets;
        };

        Shard& shard_for_(Destination const& dest) const;

        ConnectionPoolConfiguration cfg_;
        std::vector<std::unique_ptr<Shard>> shards_;
        ConnectionPoolMetrics metrics_;
    };

}  // namespace wire_cpp
