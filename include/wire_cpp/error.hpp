#pragma once
#include <string>

namespace wire_cpp {
    /**
     * @brief Represents an error occurred during an HTTP exchange.
     *
     * Every failing stage of the pipeline reports one of these codes; the
     * message names the stage and carries the underlying cause.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            InvalidUrl,          /**< The provided URL is malformed. */
            ResolveFailed,       /**< DNS returned nothing or failed. */
            UnsupportedScheme,   /**< Scheme is neither http nor https. */
            MissingSniHost,      /**< https target is a bare IP address. */
            ConnectionFailed,    /**< Failed to establish a TCP connection. */
            TlsHandshakeFailed,  /**< Failed to perform TLS handshake. */
            TlsConfigFailed,     /**< Trust store could not be loaded. */
            SendFailed,          /**< Failed to write the request. */
            ReceiveFailed,       /**< Failed to read the response. */
            HeaderTimeout,       /**< Status line not received in time. */
            MalformedStatusLine, /**< Status line does not parse. */
            InvalidHttpVersion,  /**< Version is not 1.0 or 1.1. */
            InvalidStatusCode,   /**< Status code is not an integer. */
            MalformedHeader,     /**< A header line does not parse. */
            ContinueClosed,      /**< Peer closed before 100 Continue. */
            ContinueMismatch,    /**< Peer answered something else. */
            BodyAlreadyConsumed, /**< Response body was read before. */
            MissingBodyStream,   /**< Response no longer owns a stream. */
            BodyDecodeFailed,    /**< Body is not valid text / JSON. */
            UnsupportedFraming,  /**< No Content-Length on the response. */
            FileError,           /**< File-backed body could not be used. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Stable name of an error code, for logs and test output.
    inline const char* to_string(Error::Code code) {
        switch (code) {
            case Error::Code::InvalidUrl:
                return "InvalidUrl";
            case Error::Code::ResolveFailed:
                return "ResolveFailed";
            case Error::Code::UnsupportedScheme:
                return "UnsupportedScheme";
            case Error::Code::MissingSniHost:
                return "MissingSniHost";
            case Error::Code::ConnectionFailed:
                return "ConnectionFailed";
            case Error::Code::TlsHandshakeFailed:
                return "TlsHandshakeFailed";
            case Error::Code::TlsConfigFailed:
                return "TlsConfigFailed";
            case Error::Code::SendFailed:
                return "SendFailed";
            case Error::Code::ReceiveFailed:
                return "ReceiveFailed";
            case Error::Code::HeaderTimeout:
                return "HeaderTimeout";
            case Error::Code::MalformedStatusLine:
                return "MalformedStatusLine";
            case Error::Code::InvalidHttpVersion:
                return "InvalidHttpVersion";
            case Error::Code::InvalidStatusCode:
                return "InvalidStatusCode";
            case Error::Code::MalformedHeader:
                return "MalformedHeader";
            case Error::Code::ContinueClosed:
                return "ContinueClosed";
            case Error::Code::ContinueMismatch:
                return "ContinueMismatch";
            case Error::Code::BodyAlreadyConsumed:
                return "BodyAlreadyConsumed";
            case Error::Code::MissingBodyStream:
                return "MissingBodyStream";
            case Error::Code::BodyDecodeFailed:
                return "BodyDecodeFailed";
            case Error::Code::UnsupportedFraming:
                return "UnsupportedFraming";
            case Error::Code::FileError:
                return "FileError";
        }
        return "Unknown";
    }
}  // namespace wire_cpp
