//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_RESPONSE_HPP
#define NERO_KITSU_RESPONSE_HPP

#include <simdjson.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "../error/client_error.hpp"
#include "../transport/fields.hpp"
#include "../transport/types.hpp"

namespace http::model {

    // The body can be materialized once. Every materializer is &&-qualified
    // and takes the body stream with it.
    class Response {
       public:
        Response(uint16_t status_code, http::transport::Fields headers, std::unique_ptr<http::transport::InputStream> body);

        ~Response() = default;
        Response(const Response&) = delete;
        Response& operator=(const Response&) = delete;
        Response(Response&&) noexcept = default;
        Response& operator=(Response&&) noexcept = default;

        [[nodiscard]] uint16_t status_code() const { return status_code_; }
        [[nodiscard]] const http::transport::Fields& headers() const { return headers_; }
        [[nodiscard]] std::optional<uint64_t> content_length() const;

        // Reads until the stream closes or fails. A declared Content-Length is
        // the read ceiling; without one the ceiling is unbounded.
        std::string bytes() &&;
        std::string text() &&;
        std::unique_ptr<http::transport::InputStream> input_stream() &&;

        // T provides static T from_json(simdjson::ondemand::document&).
        template <typename T>
        T json() && {
            const std::string body = std::move(*this).bytes();
            try {
                const simdjson::padded_string padded(body);

                // On-demand skips what T does not read; the DOM pass rejects any
                // malformed value or trailing content first.
                simdjson::dom::parser validator;
                [[maybe_unused]] const simdjson::dom::element root = validator.parse(padded);

                simdjson::ondemand::parser parser;
                simdjson::ondemand::document doc = parser.iterate(padded);
                return T::from_json(doc);
            } catch (const simdjson::simdjson_error& e) {
                throw http::error::ClientError::serialization(e);
            }
        }

       private:
        std::unique_ptr<http::transport::InputStream> take_body();

        uint16_t status_code_;
        http::transport::Fields headers_;
        std::unique_ptr<http::transport::InputStream> body_;
    };

}  // namespace http::model

#endif
