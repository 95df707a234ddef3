//
// Created by Daniel Griffiths on 11/1/25.
//

#include "request.hpp"

#include <simdjson.h>

#include <string>

#include "../../utils/constants.hpp"
#include "../error/client_error.hpp"

namespace http::model {
    Request::Request(http::transport::Method method, http::url::Url url) : method_(method), url_(std::move(url)) {}

    Request Request::with_headers(http::transport::Fields headers) const {
        Request next = *this;
        next.headers_ = std::move(headers);
        return next;
    }

    Request Request::with_header(std::string_view name, std::string_view value) const {
        Request next = *this;
        try {
            next.headers_.append(name, value);
        } catch (const http::transport::HeaderError& e) {
            throw http::error::ClientError::header(e);
        }
        return next;
    }

    Request Request::with_body(std::string body) const {
        Request next = *this;
        const std::string body_length = std::to_string(body.size());
        next.body_ = std::move(body);
        try {
            next.headers_.set(constants::CONTENT_LENGTH, {body_length});
        } catch (const http::transport::HeaderError& e) {
            throw http::error::ClientError::header(e);
        }
        return next;
    }

    Request Request::with_json(std::string_view json) const {
        std::string minified;
        try {
            simdjson::dom::parser parser;
            const simdjson::padded_string padded(json);
            simdjson::dom::element doc = parser.parse(padded);
            minified = simdjson::minify(doc);
        } catch (const simdjson::simdjson_error& e) {
            throw http::error::ClientError::serialization(e);
        }

        return with_header(constants::CONTENT_TYPE, constants::JSON_CONTENT_TYPE).with_body(std::move(minified));
    }
}  // namespace http::model
