#include "wire_cpp/response.hpp"

#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <charconv>
#include <exception>

#include "wire_cpp/log.hpp"
#include "wire_cpp/url.hpp"

namespace wire_cpp {

    namespace net = boost::asio;

    Response::Response(ResponseHead head, Stream stream, Destination dest,
                       std::weak_ptr<ConnectionPool> pool)
        : m_version(head.status_line.version),
          m_status(head.status_line.status),
          m_reason(std::move(head.status_line.reason)),
          m_headers(std::move(head.headers)),
          m_stream(std::in_place, std::move(stream)),
          m_dest(std::move(dest)),
          m_pool(std::move(pool)) {}

    Response::Response(Response&& other)
        : m_version(other.m_version),
          m_status(other.m_status),
          m_reason(std::move(other.m_reason)),
          m_headers(std::move(other.m_headers)),
          m_body_consumed(other.m_body_consumed),
          m_stream(std::move(other.m_stream)),
          m_dest(std::move(other.m_dest)),
          m_pool(std::move(other.m_pool)) {
        other.m_stream.reset();
    }

    Response& Response::operator=(Response&& other) {
        if (this == &other) return *this;

        return_to_pool_();

        m_version = other.m_version;
        m_status = other.m_status;
        m_reason = std::move(other.m_reason);
        m_headers = std::move(other.m_headers);
        m_body_consumed = other.m_body_consumed;
        // Stream is not move-assignable; rebuild in place.
        if (other.m_stream) m_stream.emplace(std::move(*other.m_stream));
        other.m_stream.reset();
        m_dest = std::move(other.m_dest);
        m_pool = std::move(other.m_pool);
        return *this;
    }

    Response::~Response() noexcept { return_to_pool_(); }

    void Response::return_to_pool_() noexcept {
        if (!m_stream) return;

        // A zero-length body leaves nothing on the wire, read or not.
        bool drained = m_body_consumed;
        if (!drained) {
            try {
                drained = content_length() == std::uint64_t{0};
            } catch (std::exception const&) {
                drained = false;
            }
        }

        if (drained) {
            if (auto pool = m_pool.lock()) {
                pool->release(m_dest, std::move(*m_stream));
            }
        } else {
            try {
                log::get()->debug(
                    "response body for {} not consumed, closing stream",
                    m_dest.to_string());
            } catch (std::exception const&) {
                // Logging must not escape a destructor.
            }
        }
        m_stream.reset();
    }

    std::optional<std::string_view> Response::header_one(
        std::string_view key) const {
        auto it = m_headers.find(url_utils::to_lower(key));
        if (it == m_headers.end() || it->second.empty()) return std::nullopt;
        return std::string_view(it->second.front());
    }

    std::vector<std::string_view> Response::header_all(
        std::string_view key) const {
        std::vector<std::string_view> out;
        auto it = m_headers.find(url_utils::to_lower(key));
        if (it == m_headers.end()) return out;
        out.reserve(it->second.size());
        for (auto const& v : it->second) out.emplace_back(v);
        return out;
    }

    std::optional<std::uint64_t> Response::content_length() const {
        auto v = header_one("content-length");
        if (!v) return std::nullopt;
        std::uint64_t n = 0;
        auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
        if (v->empty() || ec != std::errc{} || ptr != v->data() + v->size()) {
            return std::nullopt;
        }
        return n;
    }

    net::awaitable<Result<std::string>> Response::body_bytes() {
        using R = Result<std::string>;

        if (m_body_consumed) {
            co_return R::err(Error::Code::BodyAlreadyConsumed,
                             "response body has already been read");
        }

        auto declared = content_length();
        if (!declared) {
            co_return R::err(Error::Code::UnsupportedFraming,
                             "response has no Content-Length; only "
                             "Content-Length framing is supported");
        }
        if (*declared == 0) {
            m_body_consumed = true;
            co_return R::ok();
        }
        if (!m_stream) {
            co_return R::err(Error::Code::MissingBodyStream,
                             "response no longer owns its stream");
        }

        std::string body;
        body.reserve(static_cast<std::size_t>(
            std::min<std::uint64_t>(*declared, 1024 * 1024)));
        std::uint64_t remaining = *declared;
        char chunk[kResponseChunkSize];
        boost::system::error_code ec;

        while (remaining > 0) {
            auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(sizeof(chunk), remaining));
            std::size_t n =
                co_await m_stream->read_some(net::buffer(chunk, want), ec);
            if (ec) {
                co_return R::err(Error::Code::ReceiveFailed,
                                 "read response body: " + ec.message());
            }
            if (n == 0) {
                log::get()->info(
                    "response body truncated: peer closed with {} of {} "
                    "byte(s) unread",
                    remaining, *declared);
                break;
            }
            body.append(chunk, n);
            remaining -= n;
        }

        m_body_consumed = true;
        co_return R::ok(std::move(body));
    }

    net::awaitable<Result<std::string>> Response::body_string() {
        auto body = co_await body_bytes();
        if (body.has_error()) co_return body;
        if (!is_valid_utf8(body.value())) {
            co_return Result<std::string>::err(
                Error::Code::BodyDecodeFailed,
                "response body is not valid UTF-8");
        }
        co_return body;
    }

    bool is_valid_utf8(std::string_view bytes) noexcept {
        auto const* p = reinterpret_cast<unsigned char const*>(bytes.data());
        auto const* end = p + bytes.size();

        while (p < end) {
            unsigned char c = *p;
            if (c < 0x80) {
                ++p;
                continue;
            }

            std::size_t len = 0;
            std::uint32_t cp = 0;
            std::uint32_t min = 0;
            if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
                min = 0x80;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
                min = 0x800;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
                min = 0x10000;
            } else {
                return false;
            }

            if (static_cast<std::size_t>(end - p) < len) return false;
            for (std::size_t i = 1; i < len; ++i) {
                if ((p[i] & 0xC0) != 0x80) return false;
                cp = (cp << 6) | (p[i] & 0x3F);
            }
            if (cp < min || cp > 0x10FFFF) return false;
            if (cp >= 0xD800 && cp <= 0xDFFF) return false;
            p += len;
        }
        return true;
    }

}  // namespace wire_cpp
