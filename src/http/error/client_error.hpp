//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_CLIENT_ERROR_HPP
#define NERO_KITSU_CLIENT_ERROR_HPP

#include <simdjson.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "../transport/fields.hpp"
#include "../transport/types.hpp"

namespace http::error {

    enum class ClientErrorKind { SERIALIZATION_FAILURE, HEADER_CONSTRUCTION_FAILURE, TRANSPORT_FAILURE };

    struct ClientError : public std::runtime_error {
        ClientErrorKind kind_;
        std::optional<http::transport::ErrorCode> code_;

        explicit ClientError(ClientErrorKind kind, const std::string& msg, std::optional<http::transport::ErrorCode> code = std::nullopt);

        static ClientError serialization(const std::string& detail);
        static ClientError serialization(const simdjson::simdjson_error& e);
        static ClientError header(const http::transport::HeaderError& e);
        static ClientError transport(const http::transport::TransportError& e);
    };

    // Transport failures come back as the code they carried; every other kind
    // collapses into INTERNAL_ERROR with the rendered message.
    http::transport::ErrorCode to_error_code(const ClientError& e);

}  // namespace http::error

#endif
