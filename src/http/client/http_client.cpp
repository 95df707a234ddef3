//
// Created by Daniel Griffiths on 11/1/25.
//

#include "http_client.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../error/client_error.hpp"
#include "outgoing.hpp"

namespace http::client {

    HttpClient::HttpClient(std::shared_ptr<http::transport::IOutgoingHandler> handler) : handler_(std::move(handler)) {
        if (handler_ == nullptr) {
            throw std::invalid_argument("HttpClient requires an outgoing handler");
        }
    }

    http::model::Response HttpClient::send(http::model::Request req) {
        http::model::Response response = execute_request(req, req.url());

        if (auto location = redirect_target(response)) {
            return execute_request(req, *location);
        }

        return response;
    }

    std::optional<http::url::Url> HttpClient::redirect_target(const http::model::Response& resp) {
        const auto values = resp.headers().get(constants::LOCATION);
        if (values.empty()) {
            return std::nullopt;
        }
        return http::url::Url::parse(values.front());
    }

    void HttpClient::write_body(http::transport::OutgoingBody& body, std::string_view bytes) {
        for (size_t offset = 0; offset < bytes.size(); offset += constants::BODY_CHUNK_SIZE) {
            body.blocking_write_and_flush(bytes.substr(offset, constants::BODY_CHUNK_SIZE));
        }
        body.finish();
    }

    http::model::Response HttpClient::execute_request(const http::model::Request& req, const http::url::Url& url) const {
        try {
            auto exchange = handler_->handle(from_url(url, req.method(), req.headers()));

            if (req.body()) {
                write_body(exchange->body(), *req.body());
            }

            exchange->block();
            http::transport::IncomingResponse incoming = exchange->get();

            return {incoming.status_, std::move(incoming.headers_), std::move(incoming.body_)};
        } catch (const http::transport::TransportError& e) {
            throw http::error::ClientError::transport(e);
        }
    }

}  // namespace http::client
