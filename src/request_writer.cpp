#include "wire_cpp/protocol/request_writer.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <boost/asio/buffer.hpp>
#include <vector>

#include "wire_cpp/log.hpp"

namespace wire_cpp {

    namespace net = boost::asio;

    std::string base64_encode(std::string_view in) {
        if (in.empty()) return {};
        std::string out(4 * ((in.size() + 2) / 3) + 1, '\0');
        int n = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(out.data()),
            reinterpret_cast<const unsigned char*>(in.data()),
            static_cast<int>(in.size()));
        out.resize(n > 0 ? static_cast<std::size_t>(n) : 0);
        return out;
    }

    std::string serialize_header_lines(RequestHeaders const& headers) {
        std::string out;
        for (auto const& [key, values] : headers) {
            if (values.empty()) continue;
            out.append(key);
            out.append(": ");
            out.append(values.front());
            out.append("\r\n");
        }
        return out;
    }

    std::string serialize_request_head(Request const& req) {
        std::string out;
        out.reserve(256);

        out.append(method_token(req.method));
        out.push_back(' ');
        out.append(req.target.target());
        out.append(" HTTP/1.1\r\n");

        out.append(serialize_header_lines(req.headers));

        out.append("Content-Length: ");
        out.append(std::to_string(req.content_length));
        out.append("\r\n");

        if (req.basic_auth) {
            out.append("Authorization: Basic ");
            out.append(base64_encode(req.basic_auth->first + ":" +
                                     req.basic_auth->second));
            out.append("\r\n");
        }
        if (req.expect_continue) {
            out.append("Expect: 100-continue\r\n");
        }
        out.append("Connection: keep-alive\r\n");
        out.append("\r\n");
        return out;
    }

    net::awaitable<Status> write_request_head(Stream& stream,
                                              Request const& req) {
        const std::string head = serialize_request_head(req);

        boost::system::error_code ec;
        co_await stream.write_all(net::buffer(head), ec);
        if (ec) {
            co_return Status::err(Error::Code::SendFailed,
                                  "write request head: " + ec.message());
        }

        if (!req.expect_continue) co_return Status::ok();

        std::array<char, 1024> reply{};
        std::size_t n = co_await stream.read_some(net::buffer(reply), ec);
        if (ec) {
            co_return Status::err(Error::Code::ReceiveFailed,
                                  "read 100-continue reply: " + ec.message());
        }
        if (n == 0) {
            co_return Status::err(
                Error::Code::ContinueClosed,
                "connection closed before 100-continue reply");
        }

        std::string_view got(reply.data(), n);
        if (got != kContinueResponse) {
            log::get()->debug("expected 100 Continue, got \"{}\"",
                              std::string(got));
            co_return Status::err(Error::Code::ContinueMismatch,
                                  "server did not answer 100 Continue: " +
                                      std::string(got.substr(
                                          0, got.find("\r\n"))));
        }
        co_return Status::ok();
    }

    net::awaitable<Status> write_request_body(Stream& stream, Request& req) {
        boost::system::error_code ec;

        if (std::holds_alternative<std::monostate>(req.body)) {
            co_return Status::ok();
        }

        if (auto* literal = std::get_if<std::string>(&req.body)) {
            co_await stream.write_all(net::buffer(*literal), ec);
            if (ec) {
                co_return Status::err(Error::Code::SendFailed,
                                      "write request body: " + ec.message());
            }
            co_return Status::ok();
        }

        auto& source = std::get<std::unique_ptr<BodySource>>(req.body);
        if (!source) {
            co_return Status::err(Error::Code::MissingBodyStream,
                                  "streamed request body has no source");
        }

        std::vector<char> chunk(static_cast<std::size_t>(
            std::min<std::uint64_t>(kBodyChunkSize, req.content_length)));
        std::uint64_t remaining = req.content_length;

        while (remaining > 0) {
            auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(chunk.size(), remaining));
            std::size_t n =
                co_await source->read_some(net::buffer(chunk.data(), want), ec);
            if (ec) {
                co_return Status::err(Error::Code::SendFailed,
                                      "read body source: " + ec.message());
            }
            if (n == 0) {
                log::get()->debug(
                    "body source ended with {} declared byte(s) unsent",
                    remaining);
                break;
            }

            co_await stream.write_all(net::buffer(chunk.data(), n), ec);
            if (ec) {
                co_return Status::err(Error::Code::SendFailed,
                                      "write request body: " + ec.message());
            }
            remaining -= n;
        }
        co_return Status::ok();
    }

}  // namespace wire_cpp
