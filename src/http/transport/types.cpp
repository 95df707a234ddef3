#include "types.hpp"

#include <algorithm>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::transport {

    Scheme Scheme::from_string(std::string_view raw) {
        const std::string lowered = string_utils::to_lower(raw);
        if (lowered == "http") {
            return Scheme{.kind_ = SchemeKind::HTTP, .other_ = {}};
        }
        if (lowered == "https") {
            return Scheme{.kind_ = SchemeKind::HTTPS, .other_ = {}};
        }
        return Scheme{.kind_ = SchemeKind::OTHER, .other_ = std::string(raw)};
    }

    std::string Scheme::to_string() const {
        switch (kind_) {
            case SchemeKind::HTTP:
                return "http";
            case SchemeKind::HTTPS:
                return "https";
            case SchemeKind::OTHER:
                return other_;
        }
        return other_;
    }

    const char* to_string(Method method) {
        switch (method) {
            case Method::GET:
                return "GET";
            case Method::HEAD:
                return "HEAD";
            case Method::POST:
                return "POST";
            case Method::PUT:
                return "PUT";
            case Method::DELETE:
                return "DELETE";
            case Method::CONNECT:
                return "CONNECT";
            case Method::OPTIONS:
                return "OPTIONS";
            case Method::TRACE:
                return "TRACE";
            case Method::PATCH:
                return "PATCH";
        }
        return "GET";
    }

    const char* to_string(ErrorCodeKind kind) {
        switch (kind) {
            case ErrorCodeKind::DNS_TIMEOUT:
                return "DNS timeout";
            case ErrorCodeKind::DNS_ERROR:
                return "DNS error";
            case ErrorCodeKind::DESTINATION_NOT_FOUND:
                return "destination not found";
            case ErrorCodeKind::DESTINATION_UNAVAILABLE:
                return "destination unavailable";
            case ErrorCodeKind::DESTINATION_IP_UNROUTABLE:
                return "destination IP unroutable";
            case ErrorCodeKind::CONNECTION_REFUSED:
                return "connection refused";
            case ErrorCodeKind::CONNECTION_TERMINATED:
                return "connection terminated";
            case ErrorCodeKind::CONNECTION_TIMEOUT:
                return "connection timeout";
            case ErrorCodeKind::CONNECTION_READ_TIMEOUT:
                return "connection read timeout";
            case ErrorCodeKind::CONNECTION_WRITE_TIMEOUT:
                return "connection write timeout";
            case ErrorCodeKind::TLS_PROTOCOL_ERROR:
                return "TLS protocol error";
            case ErrorCodeKind::TLS_CERTIFICATE_ERROR:
                return "TLS certificate error";
            case ErrorCodeKind::HTTP_REQUEST_DENIED:
                return "HTTP request denied";
            case ErrorCodeKind::HTTP_REQUEST_BODY_SIZE:
                return "HTTP request body size";
            case ErrorCodeKind::HTTP_RESPONSE_INCOMPLETE:
                return "HTTP response incomplete";
            case ErrorCodeKind::HTTP_PROTOCOL_ERROR:
                return "HTTP protocol error";
            case ErrorCodeKind::HTTP_RESPONSE_TIMEOUT:
                return "HTTP response timeout";
            case ErrorCodeKind::LOOP_DETECTED:
                return "loop detected";
            case ErrorCodeKind::CONFIGURATION_ERROR:
                return "configuration error";
            case ErrorCodeKind::INTERNAL_ERROR:
                return "internal error";
        }
        return "internal error";
    }

    std::string ErrorCode::to_string() const {
        std::string out = transport::to_string(kind_);
        if (message_ && !message_->empty()) {
            out += ": " + *message_;
        }
        return out;
    }

    TransportError::TransportError(ErrorCode code) : std::runtime_error(code.to_string()), code_(std::move(code)) {}

    BufferInputStream::BufferInputStream(std::string buffer, size_t max_chunk) : buffer_(std::move(buffer)), max_chunk_(std::max<size_t>(max_chunk, 1)) {}

    std::optional<std::string> BufferInputStream::blocking_read(uint64_t max_len) {
        if (offset_ >= buffer_.size()) {
            return std::nullopt;
        }

        const size_t remaining = buffer_.size() - offset_;
        const size_t n = std::min({remaining, max_chunk_, static_cast<size_t>(std::min<uint64_t>(max_len, SIZE_MAX))});
        std::string out = buffer_.substr(offset_, n);
        offset_ += n;
        return out;
    }

}  // namespace http::transport
