#include "wire_cpp/body.hpp"

#include <algorithm>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/execution/outstanding_work.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/prefer.hpp>
#include <cstring>
#include <system_error>

namespace wire_cpp {

    namespace net = boost::asio;

    namespace {
        /// One chunk from `in`; io_error when the stream goes bad.
        std::size_t read_chunk(std::ifstream& in, net::mutable_buffer buf,
                               boost::system::error_code& ec) {
            in.read(static_cast<char*>(buf.data()),
                    static_cast<std::streamsize>(buf.size()));
            if (in.bad()) {
                ec = boost::system::errc::make_error_code(
                    boost::system::errc::io_error);
                return 0;
            }
            return static_cast<std::size_t>(in.gcount());
        }

        /// Run read_chunk() on `worker` and complete on the caller's
        /// executor, which is kept busy until then.
        template <typename CompletionToken>
        auto async_read_chunk(net::any_io_executor worker, std::ifstream& in,
                              net::mutable_buffer buf, CompletionToken&& token) {
            return net::async_initiate<CompletionToken,
                                       void(boost::system::error_code,
                                            std::size_t)>(
                [worker, &in, buf](auto handler) {
                    auto home = net::prefer(
                        net::get_associated_executor(handler),
                        net::execution::outstanding_work.tracked);
                    net::post(worker, [&in, buf, home,
                                       handler = std::move(handler)]() mutable {
                        boost::system::error_code ec;
                        std::size_t n = read_chunk(in, buf, ec);
                        net::post(home, [handler = std::move(handler), ec,
                                         n]() mutable {
                            std::move(handler)(ec, n);
                        });
                    });
                },
                token);
        }
    }  // namespace

    net::awaitable<std::size_t> BufferBodySource::read_some(
        net::mutable_buffer buf, boost::system::error_code& ec) {
        ec.clear();
        std::size_t n = std::min(buf.size(), m_data.size() - m_offset);
        if (n > 0) {
            std::memcpy(buf.data(), m_data.data() + m_offset, n);
            m_offset += n;
        }
        co_return n;
    }

    Result<std::unique_ptr<FileBodySource>> FileBodySource::open(
        std::filesystem::path const& path,
        std::optional<net::any_io_executor> blocking_executor) {
        using R = Result<std::unique_ptr<FileBodySource>>;

        std::error_code fec;
        auto size = std::filesystem::file_size(path, fec);
        if (fec) {
            return R::err(Error::Code::FileError,
                          "cannot stat " + path.string() + ": " +
                              fec.message());
        }

        std::ifstream in(path, std::ios::binary);
        if (!in) {
            return R::err(Error::Code::FileError,
                          "cannot open " + path.string());
        }
        return R::ok(std::make_unique<FileBodySource>(
            PrivateTag{}, std::move(in), size, std::move(blocking_executor)));
    }

    net::awaitable<std::size_t> FileBodySource::read_some(
        net::mutable_buffer buf, boost::system::error_code& ec) {
        ec.clear();
        if (!m_in || buf.size() == 0) co_return 0;

        if (!m_worker) co_return read_chunk(m_in, buf, ec);
        co_return co_await async_read_chunk(
            *m_worker, m_in, buf, net::redirect_error(net::use_awaitable, ec));
    }

}  // namespace wire_cpp
