#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <memory>
#include <string>

#include "wire_cpp/config.hpp"
#include "wire_cpp/connection/connection_pool.hpp"
#include "wire_cpp/connection/destination.hpp"
#include "wire_cpp/connection/stream.hpp"
#include "wire_cpp/request.hpp"
#include "wire_cpp/response.hpp"
#include "wire_cpp/result.hpp"

namespace wire_cpp {

    /// @brief A request whose head has been sent (and, with
    /// expect-continue, acknowledged) but whose body has not.
    struct PendingRequest {
        Stream stream;
        Destination destination;
    };

    /**
     * @brief An asynchronous HTTP/1.1 client using C++20 coroutines.
     *
     * Each send resolves the host, takes a pooled keep-alive connection or
     * opens a new one, writes the request and parses the response head.
     * The connection goes back to the pool once the Response body has been
     * read and the Response is destroyed.
     *
     * Requests may run concurrently from independent coroutines. No request
     * is ever retried.
     */
    class Client {
       public:
        /**
         * @brief Constructs a Client.
         * @param ex Executor for all sockets and timers.
         * @param cfg Client and pool configuration.
         * @throws std::runtime_error when the TLS trust store cannot be
         * loaded.
         */
        explicit Client(boost::asio::any_io_executor ex,
                        ClientConfiguration cfg = {});

        /**
         * @brief Send a request and read the response head.
         * @param req The request. A streamed body is drained from it.
         * @return The Response with its body still on the wire, or an Error
         * naming the stage that failed.
         */
        boost::asio::awaitable<Result<Response>> send(Request& req);

        /**
         * @brief First half of send(): connect and write the request head.
         *
         * With expect-continue set, returns only after the server answered
         * `100 Continue`, so the caller can still decide to drop the body.
         */
        boost::asio::awaitable<Result<PendingRequest>> send_head(Request& req);

        /// @brief Second half of send(): write the body and read the
        /// response head.
        boost::asio::awaitable<Result<Response>> send_body(
            Request& req, PendingRequest pending);

        /// @brief GET `url`.
        boost::asio::awaitable<Result<Response>> get(std::string url);

        /// @brief POST `body` to `url`.
        boost::asio::awaitable<Result<Response>> post(std::string url,
                                                      std::string body);

        std::shared_ptr<ConnectionPool> const& pool() const noexcept {
            return pool_;
        }

        [[nodiscard]] ClientConfiguration const& config() const noexcept {
            return cfg_;
        }

       private:
        using tcp = boost::asio::ip::tcp;

        /// @brief host and user-agent, unless the request carries them.
        void add_default_headers_(Request& req) const;

        ClientConfiguration cfg_;

        boost::asio::any_io_executor ex_;
        tcp::resolver resolver_;

        boost::asio::ssl::context ssl_ctx_;

        std::shared_ptr<ConnectionPool> pool_;
    };

}  // namespace wire_cpp
