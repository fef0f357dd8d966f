#pragma once

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "wire_cpp/result.hpp"

namespace wire_cpp {

    /**
     * @brief Where the client finds the certificate authorities it trusts.
     */
    struct TrustStore {
        enum class Source {
            System,   /**< OpenSSL default verify paths. */
            PemBytes, /**< PEM text held in memory. */
            PemFile   /**< PEM bundle on disk. */
        };

        Source source{Source::System};
        std::string pem;
        std::filesystem::path path;

        static TrustStore system() { return TrustStore{}; }

        static TrustStore from_pem(std::string pem_text) {
            TrustStore t;
            t.source = Source::PemBytes;
            t.pem = std::move(pem_text);
            return t;
        }

        static TrustStore from_file(std::filesystem::path pem_path) {
            TrustStore t;
            t.source = Source::PemFile;
            t.path = std::move(pem_path);
            return t;
        }
    };

    /// @brief Add every certificate of a PEM bundle to the context's store.
    /// Blocks that fail to parse are skipped with a warning.
    /// @return Number of certificates added.
    std::size_t add_pem_certificates(boost::asio::ssl::context& ctx,
                                     std::string_view pem);

    /**
     * @brief Build a TLS client context for the given trust store.
     * @param trust Trust anchors to load.
     * @param verify_peer Whether the server certificate is verified.
     * @return The context, or Error::Code::TlsConfigFailed (nothing usable
     * loaded) / Error::Code::FileError (bundle unreadable).
     */
    Result<boost::asio::ssl::context> make_tls_context(TrustStore const& trust,
                                                       bool verify_peer = true);

    /// @brief Set the SNI extension on a client TLS stream.
    inline bool set_sni(
        boost::beast::ssl_stream<boost::beast::tcp_stream>& stream,
        const std::string& host, boost::system::error_code& ec) {
        if (!SSL_set_tlsext_host_name(stream.native_handle(), host.c_str())) {
            ec = boost::system::error_code(
                static_cast<int>(::ERR_get_error()),
                boost::asio::error::get_ssl_category());
            return false;
        }
        return true;
    }

}  // namespace wire_cpp
