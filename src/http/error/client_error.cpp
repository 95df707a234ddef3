//
// Created by Daniel Griffiths on 11/1/25.
//

#include "client_error.hpp"

#include <stdexcept>
#include <string>

namespace http::error {
    ClientError::ClientError(ClientErrorKind kind, const std::string& msg, std::optional<http::transport::ErrorCode> code)
        : std::runtime_error(msg), kind_(kind), code_(std::move(code)) {}

    ClientError ClientError::serialization(const std::string& detail) {
        return ClientError(ClientErrorKind::SERIALIZATION_FAILURE, "JSON serialization error: " + detail);
    }

    ClientError ClientError::serialization(const simdjson::simdjson_error& e) { return serialization(std::string(e.what())); }

    ClientError ClientError::header(const http::transport::HeaderError& e) {
        return ClientError(ClientErrorKind::HEADER_CONSTRUCTION_FAILURE, "Header error: " + std::string(e.what()));
    }

    ClientError ClientError::transport(const http::transport::TransportError& e) {
        return ClientError(ClientErrorKind::TRANSPORT_FAILURE, "HTTP error: " + e.code_.to_string(), e.code_);
    }

    http::transport::ErrorCode to_error_code(const ClientError& e) {
        if (e.kind_ == ClientErrorKind::TRANSPORT_FAILURE && e.code_) {
            return *e.code_;
        }
        return http::transport::ErrorCode{.kind_ = http::transport::ErrorCodeKind::INTERNAL_ERROR, .message_ = std::string(e.what())};
    }
}  // namespace http::error
