#include "wire_cpp/protocol/response_reader.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <charconv>

#include "wire_cpp/log.hpp"
#include "wire_cpp/url.hpp"

namespace wire_cpp {

    namespace net = boost::asio;

    namespace {
        bool ends_with(std::string_view s, std::string_view suffix) {
            return s.size() >= suffix.size() &&
                   s.substr(s.size() - suffix.size()) == suffix;
        }

        Error read_error(boost::system::error_code const& ec,
                         std::string_view what) {
            if (ec == boost::beast::error::timeout) {
                return Error{Error::Code::HeaderTimeout,
                             "timed out reading " + std::string(what)};
            }
            return Error{Error::Code::ReceiveFailed,
                         "read " + std::string(what) + ": " + ec.message()};
        }

        Error head_too_large(std::size_t max_bytes) {
            return Error{Error::Code::MalformedHeader,
                         "response head exceeds " + std::to_string(max_bytes) +
                             " bytes"};
        }

        /// Header block: a lone CRLF (no headers) or lines up to CRLFCRLF.
        net::awaitable<Result<std::string>> read_header_block(
            Stream& stream, std::size_t max_bytes) {
            std::string buf;
            char byte = 0;
            boost::system::error_code ec;
            for (;;) {
                if (buf.size() >= max_bytes) {
                    co_return Result<std::string>::err(
                        head_too_large(max_bytes));
                }
                std::size_t n =
                    co_await stream.read_some(net::buffer(&byte, 1), ec);
                if (ec) {
                    co_return Result<std::string>::err(
                        read_error(ec, "header block"));
                }
                if (n == 0) {
                    co_return Result<std::string>::err(
                        Error::Code::ReceiveFailed,
                        "connection closed while reading header block");
                }
                buf.push_back(byte);
                if (buf == "\r\n" || ends_with(buf, "\r\n\r\n")) break;
            }
            co_return Result<std::string>::ok(std::move(buf));
        }
    }  // namespace

    net::awaitable<Result<std::string>> read_until(Stream& stream,
                                                   std::string_view delimiter,
                                                   std::size_t max_bytes) {
        std::string buf;
        if (delimiter.empty()) co_return Result<std::string>::ok(std::move(buf));

        char byte = 0;
        boost::system::error_code ec;
        while (!ends_with(buf, delimiter)) {
            if (buf.size() >= max_bytes) {
                co_return Result<std::string>::err(head_too_large(max_bytes));
            }
            std::size_t n = co_await stream.read_some(net::buffer(&byte, 1), ec);
            if (ec) {
                co_return Result<std::string>::err(read_error(ec, "response"));
            }
            if (n == 0) {
                co_return Result<std::string>::err(
                    Error::Code::ReceiveFailed,
                    "connection closed before delimiter");
            }
            buf.push_back(byte);
        }
        co_return Result<std::string>::ok(std::move(buf));
    }

    Result<StatusLine> parse_status_line(std::string_view line) {
        using R = Result<StatusLine>;
        constexpr std::string_view kPrefix = "HTTP/";

        if (line.substr(0, kPrefix.size()) != kPrefix) {
            return R::err(Error::Code::MalformedStatusLine,
                          "status line does not start with HTTP/: " +
                              std::string(line));
        }
        std::string_view rest = line.substr(kPrefix.size());

        auto sp = rest.find(' ');
        if (sp == std::string_view::npos) {
            return R::err(Error::Code::MalformedStatusLine,
                          "status line has no status code: " +
                              std::string(line));
        }
        std::string_view version = rest.substr(0, sp);
        rest = rest.substr(sp + 1);

        auto code_end = rest.find_first_of(" \r");
        std::string_view code = rest.substr(0, code_end);
        std::string_view reason;
        if (code_end != std::string_view::npos && rest[code_end] == ' ') {
            reason = rest.substr(code_end + 1);
            reason = reason.substr(0, reason.find_first_of("\r\n"));
        }

        StatusLine out;
        if (version == "1.1") {
            out.version = HttpVersion::Http11;
        } else if (version == "1.0") {
            out.version = HttpVersion::Http10;
        } else {
            return R::err(Error::Code::InvalidHttpVersion,
                          "unsupported HTTP version: " + std::string(version));
        }

        std::uint16_t status = 0;
        auto [ptr, ec] =
            std::from_chars(code.data(), code.data() + code.size(), status);
        if (code.empty() || ec != std::errc{} ||
            ptr != code.data() + code.size()) {
            return R::err(Error::Code::InvalidStatusCode,
                          "invalid status code: " + std::string(code));
        }
        out.status = status;
        out.reason = std::string(reason);
        return R::ok(std::move(out));
    }

    Result<std::pair<HeaderLine, std::string_view>> parse_header_line(
        std::string_view input) {
        using R = Result<std::pair<HeaderLine, std::string_view>>;
        auto fail = [&](const char* what) {
            auto line = input.substr(0, input.find("\r\n"));
            return R::err(Error::Code::MalformedHeader,
                          std::string(what) + ": " + std::string(line));
        };

        auto key_end = input.find_first_of(": ");
        if (key_end == 0 || key_end == std::string_view::npos) {
            return fail("header line has no key");
        }
        std::string_view key = input.substr(0, key_end);
        std::string_view rest = input.substr(key_end);
        if (rest.substr(0, 2) != ": ") {
            return fail("header key must be followed by \": \"");
        }
        rest = rest.substr(2);

        auto value_end = rest.find_first_of("\r\n");
        if (value_end == std::string_view::npos) {
            return fail("header line is not terminated");
        }
        std::string_view value = rest.substr(0, value_end);
        rest = rest.substr(value_end);
        if (rest.substr(0, 2) != "\r\n") {
            return fail("header line must end with CRLF");
        }
        return R::ok(HeaderLine{key, value}, rest.substr(2));
    }

    Result<ResponseHeaders> parse_header_block(std::string_view block) {
        ResponseHeaders headers;
        std::string_view rest = block;
        while (rest != "\r\n") {
            auto line = parse_header_line(rest);
            if (line.has_error()) {
                log::get()->debug("header parse failed: {}",
                                  line.error().message);
                return std::move(line).forward_error<ResponseHeaders>();
            }
            auto [header, tail] = line.value();
            headers[url_utils::to_lower(header.key)].emplace_back(header.value);
            rest = tail;
        }
        return Result<ResponseHeaders>::ok(std::move(headers));
    }

    net::awaitable<Result<ResponseHead>> read_response_head(
        Stream& stream,
        std::optional<std::chrono::milliseconds> header_timeout,
        std::size_t max_head_bytes) {
        using R = Result<ResponseHead>;

        if (header_timeout) stream.expires_after(*header_timeout);
        auto line = co_await read_until(stream, "\r\n", max_head_bytes);
        if (header_timeout) stream.expires_never();
        if (line.has_error()) {
            co_return std::move(line).forward_error<ResponseHead>();
        }

        auto status = parse_status_line(line.value());
        if (status.has_error()) {
            log::get()->debug("status line parse failed: {}",
                              status.error().message);
            co_return std::move(status).forward_error<ResponseHead>();
        }

        auto block = co_await read_header_block(
            stream, max_head_bytes - line.value().size());
        if (block.has_error()) {
            co_return std::move(block).forward_error<ResponseHead>();
        }

        auto headers = parse_header_block(block.value());
        if (headers.has_error()) {
            co_return std::move(headers).forward_error<ResponseHead>();
        }

        co_return R::ok(ResponseHead{std::move(status).value(),
                                     std::move(headers).value()});
    }

}  // namespace wire_cpp
