#include "wire_cpp/connection/connection_pool.hpp"

#include <exception>
#include <functional>

#include "wire_cpp/connection/liveness.hpp"
#include "wire_cpp/log.hpp"

namespace wire_cpp {

    ConnectionPool::ConnectionPool(ConnectionPoolConfiguration cfg)
        : cfg_(std::move(cfg)) {
        if (cfg_.shard_count == 0) cfg_.shard_count = 1;
        shards_.reserve(cfg_.shard_count);
        for (std::size_t i = 0; i < cfg_.shard_count; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    ConnectionPool::Shard& ConnectionPool::shard_for_(
        Destination const& dest) const {
        auto h = std::hash<Destination>{}(dest);
        return *shards_[h % shards_.size()];
    }

    std::optional<Stream> ConnectionPool::try_pop(Destination const& dest) {
        auto& shard = shard_for_(dest);
        std::lock_guard<std::mutex> lk(shard.mu);

        auto it = shard.buckets.find(dest);
        if (it == shard.buckets.end() || it->second.streams.empty()) {
            return std::nullopt;
        }

        auto& streams = it->second.streams;
        std::optional<Stream> out(std::in_place, std::move(streams.back()));
        streams.pop_back();
        metrics_.total_idle.fetch_sub(1, std::memory_order_relaxed);
        return out;
    }

    boost::asio::awaitable<std::optional<Stream>> ConnectionPool::acquire(
        Destination dest) {
        auto stream = try_pop(dest);
        auto logger = log::get();

        if (!stream) {
            metrics_.acquire_miss.fetch_add(1, std::memory_order_relaxed);
            logger->debug("pool: miss for {}", dest.to_string());
            co_return std::nullopt;
        }
        metrics_.acquire_hit.fetch_add(1, std::memory_order_relaxed);

        auto outcome = co_await probe_liveness(*stream, cfg_.probe_timeout);
        if (!is_alive(outcome)) {
            metrics_.connection_dropped_unhealthy.fetch_add(
                1, std::memory_order_relaxed);
            logger->debug("pool: discarding stream for {} ({})",
                          dest.to_string(), to_string(outcome));
            stream->close();
            co_return std::nullopt;
        }

        metrics_.connection_reused.fetch_add(1, std::memory_order_relaxed);
        logger->debug("pool: reusing stream for {}", dest.to_string());
        co_return std::move(stream);
    }

    void ConnectionPool::release(Destination const& dest,
                                 Stream stream) noexcept {
        try {
            if (!stream.is_open()) return;

            auto& shard = shard_for_(dest);
            {
                std::lock_guard<std::mutex> lk(shard.mu);
                auto& bucket = shard.buckets[dest];
                if (bucket.streams.size() < cfg_.max_idle_per_destination) {
                    bucket.streams.push_back(std::move(stream));
                    metrics_.total_idle.fetch_add(1,
                                                  std::memory_order_relaxed);
                    metrics_.released.fetch_add(1, std::memory_order_relaxed);
                    return;
                }
            }

            metrics_.release_overflow.fetch_add(1, std::memory_order_relaxed);
            log::get()->debug("pool: bucket for {} full, closing stream",
                              dest.to_string());
            stream.close();
        } catch (std::exception const& e) {
            // The stream is destroyed (and closed) on the way out.
            log::get()->warn("pool: release for {} failed: {}",
                             dest.to_string(), e.what());
        }
    }

    std::size_t ConnectionPool::idle_count(Destination const& dest) const {
        auto& shard = shard_for_(dest);
        std::lock_guard<std::mutex> lk(shard.mu);
        auto it = shard.buckets.find(dest);
        return it == shard.buckets.end() ? 0 : it->second.streams.size();
    }

    std::size_t ConnectionPool::total_idle() const {
        std::size_t n = 0;
        for (auto const& shard : shards_) {
            std::lock_guard<std::mutex> lk(shard->mu);
            for (auto const& [dest, bucket] : shard->buckets) {
                n += bucket.streams.size();
            }
        }
        return n;
    }

    void ConnectionPool::clear() {
        for (auto& shard : shards_) {
            std::unordered_map<Destination, Bucket> doomed;
            {
                std::lock_guard<std::mutex> lk(shard->mu);
                doomed.swap(shard->buckets);
            }
            for (auto& [dest, bucket] : doomed) {
                metrics_.total_idle.fetch_sub(bucket.streams.size(),
                                              std::memory_order_relaxed);
            }
            // Streams close as `doomed` goes out of scope, outside the lock.
        }
    }

}  // namespace wire_cpp
