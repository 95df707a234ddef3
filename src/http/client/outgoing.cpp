#include "outgoing.hpp"

#include <string>

namespace http::client {

    std::string path_with_query(const http::url::Url& url) {
        if (url.query()) {
            return url.path() + "?" + *url.query();
        }
        return url.path();
    }

    http::transport::OutgoingRequest from_url(const http::url::Url& url, http::transport::Method method, http::transport::Fields headers) {
        return http::transport::OutgoingRequest{
            .method_ = method,
            .scheme_ = http::transport::Scheme::from_string(url.scheme()),
            .authority_ = url.authority(),
            .path_with_query_ = path_with_query(url),
            .headers_ = std::move(headers),
        };
    }

}  // namespace http::client
