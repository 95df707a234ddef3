#ifndef NERO_KITSU_CLIENT_OUTGOING_HPP
#define NERO_KITSU_CLIENT_OUTGOING_HPP

#include <string>

#include "../transport/fields.hpp"
#include "../transport/types.hpp"
#include "../url/url.hpp"

namespace http::client {

    // "path?query" when the URL has a query, "path" otherwise. An empty query
    // and no query at all are not told apart.
    std::string path_with_query(const http::url::Url& url);

    http::transport::OutgoingRequest from_url(const http::url::Url& url, http::transport::Method method, http::transport::Fields headers);

}  // namespace http::client

#endif
