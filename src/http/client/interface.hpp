#ifndef NERO_KITSU_CLIENT_INTERFACE_HPP
#define NERO_KITSU_CLIENT_INTERFACE_HPP

#include "../model/request.hpp"
#include "../model/response.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Throws http::error::ClientError.
        virtual http::model::Response send(http::model::Request req) = 0;
    };
}  // namespace http::client

#endif
