#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <chrono>

#include "wire_cpp/connection/stream.hpp"

namespace wire_cpp {

    /** @brief What a liveness probe observed on an idle connection. */
    enum class ProbeOutcome {
        Idle,           /**< Timed out with nothing to read: alive. */
        UnexpectedData, /**< Bytes waiting on an idle socket: alive. */
        PeerClosed,     /**< Zero-byte peek: the peer closed. */
        Failed          /**< Probe I/O error: treated as closed. */
    };

    inline constexpr bool is_alive(ProbeOutcome o) noexcept {
        return o == ProbeOutcome::Idle || o == ProbeOutcome::UnexpectedData;
    }

    inline const char* to_string(ProbeOutcome o) {
        switch (o) {
            case ProbeOutcome::Idle:
                return "Idle";
            case ProbeOutcome::UnexpectedData:
                return "UnexpectedData";
            case ProbeOutcome::PeerClosed:
                return "PeerClosed";
            case ProbeOutcome::Failed:
                return "Failed";
        }
        return "Unknown";
    }

    /**
     * @brief Peek one byte on the raw TCP socket, bounded by `timeout`.
     *
     * Nothing is consumed and the TLS record layer is bypassed. This is a
     * heuristic: a peer that is slowly writing a response looks exactly like
     * an idle keep-alive connection until its bytes arrive.
     *
     * The peek and its timeout run on a private strand, so this is
     * safe on an io_context run by several threads.
     */
    boost::asio::awaitable<ProbeOutcome> probe_liveness(
        Stream& stream, std::chrono::steady_clock::duration timeout);

}  // namespace wire_cpp
