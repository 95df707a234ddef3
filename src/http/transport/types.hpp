#ifndef NERO_KITSU_TRANSPORT_TYPES_HPP
#define NERO_KITSU_TRANSPORT_TYPES_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "fields.hpp"

namespace http::transport {

    enum class Method { GET, HEAD, POST, PUT, DELETE, CONNECT, OPTIONS, TRACE, PATCH };

    enum class SchemeKind { HTTP, HTTPS, OTHER };

    struct Scheme {
        SchemeKind kind_ = SchemeKind::HTTPS;
        std::string other_;

        static Scheme from_string(std::string_view raw);
        [[nodiscard]] std::string to_string() const;
        bool operator==(const Scheme&) const = default;
    };

    enum class ErrorCodeKind {
        DNS_TIMEOUT,
        DNS_ERROR,
        DESTINATION_NOT_FOUND,
        DESTINATION_UNAVAILABLE,
        DESTINATION_IP_UNROUTABLE,
        CONNECTION_REFUSED,
        CONNECTION_TERMINATED,
        CONNECTION_TIMEOUT,
        CONNECTION_READ_TIMEOUT,
        CONNECTION_WRITE_TIMEOUT,
        TLS_PROTOCOL_ERROR,
        TLS_CERTIFICATE_ERROR,
        HTTP_REQUEST_DENIED,
        HTTP_REQUEST_BODY_SIZE,
        HTTP_RESPONSE_INCOMPLETE,
        HTTP_PROTOCOL_ERROR,
        HTTP_RESPONSE_TIMEOUT,
        LOOP_DETECTED,
        CONFIGURATION_ERROR,
        INTERNAL_ERROR,
    };

    struct ErrorCode {
        ErrorCodeKind kind_ = ErrorCodeKind::INTERNAL_ERROR;
        std::optional<std::string> message_;

        [[nodiscard]] std::string to_string() const;
        bool operator==(const ErrorCode&) const = default;
    };

    const char* to_string(Method method);
    const char* to_string(ErrorCodeKind kind);

    struct TransportError : public std::runtime_error {
        ErrorCode code_;
        explicit TransportError(ErrorCode code);
    };

    struct OutgoingRequest {
        Method method_ = Method::GET;
        Scheme scheme_;
        std::string authority_;
        std::string path_with_query_;
        Fields headers_;
    };

    // Write side of a request body. Both calls throw TransportError.
    class OutgoingBody {
       public:
        OutgoingBody() = default;
        virtual ~OutgoingBody() = default;
        OutgoingBody(const OutgoingBody&) = delete;
        OutgoingBody& operator=(const OutgoingBody&) = delete;
        OutgoingBody(OutgoingBody&&) = delete;
        OutgoingBody& operator=(OutgoingBody&&) = delete;

        virtual void blocking_write_and_flush(std::string_view chunk) = 0;
        // Closes the stream; no trailers are sent.
        virtual void finish() = 0;
    };

    class InputStream {
       public:
        InputStream() = default;
        virtual ~InputStream() = default;
        InputStream(const InputStream&) = delete;
        InputStream& operator=(const InputStream&) = delete;
        InputStream(InputStream&&) = delete;
        InputStream& operator=(InputStream&&) = delete;

        // Blocks until at least one byte is available and returns at most
        // max_len bytes. std::nullopt once the stream is closed or failed.
        virtual std::optional<std::string> blocking_read(uint64_t max_len) = 0;
    };

    struct IncomingResponse {
        uint16_t status_ = 0;
        Fields headers_;
        std::unique_ptr<InputStream> body_;
    };

    // Stream over an owned buffer, handed out in pieces of at most
    // max_chunk bytes.
    class BufferInputStream : public InputStream {
       public:
        explicit BufferInputStream(std::string buffer, size_t max_chunk = SIZE_MAX);

        std::optional<std::string> blocking_read(uint64_t max_len) override;

       private:
        std::string buffer_;
        size_t offset_ = 0;
        size_t max_chunk_;
    };

}  // namespace http::transport

#endif
