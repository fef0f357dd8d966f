#pragma once

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include "wire_cpp/result.hpp"

namespace wire_cpp {

    /**
     * @brief A source of request body bytes.
     *
     * read_some() returns 0 once the source is exhausted. The transfer stops
     * there even if fewer bytes than the declared Content-Length were sent.
     */
    class BodySource {
       public:
        virtual ~BodySource() = default;

        virtual boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buf, boost::system::error_code& ec) = 0;
    };

    /// @brief Body bytes held in memory.
    class BufferBodySource final : public BodySource {
       public:
        explicit BufferBodySource(std::string data) : m_data(std::move(data)) {}

        std::size_t size() const noexcept { return m_data.size(); }

        boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buf,
            boost::system::error_code& ec) override;

       private:
        std::string m_data;
        std::size_t m_offset{0};
    };

    /**
     * @brief A file on disk, read in chunks.
     *
     * Reads are blocking filesystem calls. Without a blocking executor they
     * run inline on the coroutine's thread; pass one (a thread_pool's, for
     * instance) to keep large uploads off the I/O threads.
     */
    class FileBodySource final : public BodySource {
        struct PrivateTag {
            explicit PrivateTag() = default;
        };

       public:
        /// @brief Open `path` for reading.
        /// @param blocking_executor Where chunk reads run, if not inline.
        /// @return The source, or Error::Code::FileError.
        static Result<std::unique_ptr<FileBodySource>> open(
            std::filesystem::path const& path,
            std::optional<boost::asio::any_io_executor> blocking_executor =
                std::nullopt);

        FileBodySource(PrivateTag, std::ifstream in, std::uint64_t size,
                       std::optional<boost::asio::any_io_executor> worker)
            : m_in(std::move(in)), m_size(size), m_worker(std::move(worker)) {}

        /// @brief File length at open time.
        std::uint64_t size() const noexcept { return m_size; }

        boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buf,
            boost::system::error_code& ec) override;

       private:
        std::ifstream m_in;
        std::uint64_t m_size;
        std::optional<boost::asio::any_io_executor> m_worker;
    };

    /**
     * @brief Adapts any Asio AsyncReadStream (socket, pipe, Stream-like
     * test double) into a BodySource.
     * @tparam AsyncReadStream Owned by the adapter.
     */
    template <typename AsyncReadStream>
    class AsyncStreamBodySource final : public BodySource {
       public:
        explicit AsyncStreamBodySource(AsyncReadStream stream)
            : m_stream(std::move(stream)) {}

        boost::asio::awaitable<std::size_t> read_some(
            boost::asio::mutable_buffer buf,
            boost::system::error_code& ec) override {
            ec.clear();
            std::size_t n = co_await m_stream.async_read_some(
                buf, boost::asio::redirect_error(boost::asio::use_awaitable,
                                                 ec));
            if (ec == boost::asio::error::eof) {
                ec.clear();
                co_return 0;
            }
            co_return n;
        }

        AsyncReadStream& stream() noexcept { return m_stream; }

       private:
        AsyncReadStream m_stream;
    };

    /// @brief What follows the request head: nothing, a literal string or a
    /// length-bounded byte source.
    using RequestBody =
        std::variant<std::monostate, std::string, std::unique_ptr<BodySource>>;

}  // namespace wire_cpp
