#include "wire_cpp/tls.hpp"

#include <fstream>
#include <iterator>
#include <sstream>

#include "wire_cpp/log.hpp"

namespace wire_cpp {

    namespace ssl = boost::asio::ssl;

    namespace {
        constexpr std::string_view kBeginCert = "-----BEGIN CERTIFICATE-----";
        constexpr std::string_view kEndCert = "-----END CERTIFICATE-----";

        Result<std::string> read_pem_file(std::filesystem::path const& path) {
            std::ifstream in(path, std::ios::binary);
            if (!in) {
                return Result<std::string>::err(
                    Error::Code::FileError,
                    "failed to open trust store file " + path.string());
            }
            std::ostringstream buf;
            buf << in.rdbuf();
            if (in.bad()) {
                return Result<std::string>::err(
                    Error::Code::FileError,
                    "failed to read trust store file " + path.string());
            }
            return Result<std::string>::ok(buf.str());
        }
    }  // namespace

    std::size_t add_pem_certificates(ssl::context& ctx, std::string_view pem) {
        std::size_t added = 0;
        std::size_t index = 0;
        std::size_t pos = 0;

        while ((pos = pem.find(kBeginCert, pos)) != std::string_view::npos) {
            auto end = pem.find(kEndCert, pos);
            if (end == std::string_view::npos) {
                log::get()->warn(
                    "certificate #{} has no END marker, skipping the rest of "
                    "the bundle",
                    index);
                break;
            }
            end += kEndCert.size();

            std::string_view block = pem.substr(pos, end - pos);
            boost::system::error_code ec;
            ctx.add_certificate_authority(
                boost::asio::buffer(block.data(), block.size()), ec);
            if (ec) {
                log::get()->warn("failed to parse certificate #{}: {}",
                                  index, ec.message());
            } else {
                ++added;
            }

            ++index;
            pos = end;
        }
        return added;
    }

    Result<ssl::context> make_tls_context(TrustStore const& trust,
                                          bool verify_peer) {
        ssl::context ctx(ssl::context::tls_client);

        switch (trust.source) {
            case TrustStore::Source::System: {
                boost::system::error_code ec;
                ctx.set_default_verify_paths(ec);
                if (ec) {
                    return Result<ssl::context>::err(
                        Error::Code::TlsConfigFailed,
                        "failed to load system certificates: " + ec.message());
                }
                break;
            }
            case TrustStore::Source::PemBytes: {
                if (add_pem_certificates(ctx, trust.pem) == 0) {
                    return Result<ssl::context>::err(
                        Error::Code::TlsConfigFailed,
                        "no certificate could be loaded from the PEM data");
                }
                break;
            }
            case TrustStore::Source::PemFile: {
                auto pem = read_pem_file(trust.path);
                if (pem.has_error()) {
                    return std::move(pem).forward_error<ssl::context>();
                }
                if (add_pem_certificates(ctx, pem.value()) == 0) {
                    return Result<ssl::context>::err(
                        Error::Code::TlsConfigFailed,
                        "no certificate could be loaded from " +
                            trust.path.string());
                }
                break;
            }
        }

        ctx.set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
        return Result<ssl::context>::ok(std::move(ctx));
    }

}  // namespace wire_cpp
