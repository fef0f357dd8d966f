#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "wire_cpp/tls.hpp"

namespace wire_cpp {
    /**
     * @brief Configuration for the connection pool.
     */
    struct ConnectionPoolConfiguration {
        /** @brief Idle streams kept per destination; excess ones are closed. */
        std::size_t max_idle_per_destination{30};

        /** @brief Bound on the liveness peek of a pooled stream. */
        std::chrono::milliseconds probe_timeout{1000};

        /** @brief Independent lock shards the buckets are spread over. */
        std::size_t shard_count{16};
    };

    /**
     * @brief Configuration for the Client.
     */
    struct ClientConfiguration {
        /** @brief User-Agent sent when a request carries none. */
        std::string user_agent{"wire_cpp/1.0"};

        /** @brief Bound on TCP connect plus TLS handshake. */
        std::chrono::milliseconds connect_timeout{5000};

        /** @brief Bound on reading the status line, unless the request
         * sets its own. std::nullopt waits forever. */
        std::optional<std::chrono::milliseconds> header_timeout{
            std::chrono::seconds(30)};

        /** @brief Overall request deadline. Recorded only: the body read has
         * no deadline. */
        std::chrono::milliseconds total_timeout{std::chrono::seconds(300)};

        /** @brief Largest accepted status line plus header block. */
        std::size_t max_header_bytes{64 * 1024};

        /** @brief Certificate authorities used for https. */
        TrustStore trust_store{};

        /** @brief Whether to verify the server certificate and host name. */
        bool verify_tls{true};

        /** @brief Idle connection pool settings. */
        ConnectionPoolConfiguration pool_config;
    };
}  // namespace wire_cpp
