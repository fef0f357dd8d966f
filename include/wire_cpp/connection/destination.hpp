#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace wire_cpp {

    /** @brief How bytes travel to a destination. */
    enum class TransportKind : std::uint8_t {
        Plain,  /**< Direct TCP socket. */
        Secure  /**< TLS session over a TCP socket. */
    };

    inline const char* to_string(TransportKind kind) {
        return kind == TransportKind::Secure ? "secure" : "plain";
    }

    /**
     * @brief Resolved address plus transport kind; identifies a pool bucket.
     *
     * Not a URL: the same host maps to a different Destination when DNS
     * starts returning another address.
     */
    struct Destination {
        boost::asio::ip::tcp::endpoint address;
        TransportKind kind{TransportKind::Plain};

        std::string to_string() const {
            return address.address().to_string() + ":" +
                   std::to_string(address.port()) + "/" +
                   wire_cpp::to_string(kind);
        }

        friend bool operator==(Destination const& a,
                               Destination const& b) noexcept {
            return a.kind == b.kind && a.address == b.address;
        }

        friend bool operator!=(Destination const& a,
                               Destination const& b) noexcept {
            return !(a == b);
        }
    };

}  // namespace wire_cpp

namespace std {
    template <>
    struct hash<wire_cpp::Destination> {
        size_t operator()(wire_cpp::Destination const& d) const noexcept {
            // FNV-1a over kind, address bytes and port.
            size_t h = 1469598103934665603ull;
            auto mix = [&](unsigned char c) {
                h ^= c;
                h *= 1099511628211ull;
            };
            mix(static_cast<unsigned char>(d.kind));
            auto const addr = d.address.address();
            if (addr.is_v4()) {
                for (unsigned char c : addr.to_v4().to_bytes()) mix(c);
            } else {
                for (unsigned char c : addr.to_v6().to_bytes()) mix(c);
            }
            auto const port = d.address.port();
            mix(static_cast<unsigned char>(port >> 8));
            mix(static_cast<unsigned char>(port & 0xff));
            return h;
        }
    };
}  // namespace std
