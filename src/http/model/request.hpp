//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_REQUEST_HPP
#define NERO_KITSU_REQUEST_HPP

#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

#include "../transport/fields.hpp"
#include "../transport/types.hpp"
#include "../url/url.hpp"

namespace http::model {

    // Request under construction. Every with_* step leaves *this untouched and
    // returns the updated copy, so a failed step keeps the previous state.
    class Request {
       public:
        Request(http::transport::Method method, http::url::Url url);

        [[nodiscard]] Request with_headers(http::transport::Fields headers) const;
        [[nodiscard]] Request with_header(std::string_view name, std::string_view value) const;
        // Also sets Content-Length to the exact byte length of body.
        [[nodiscard]] Request with_body(std::string body) const;
        [[nodiscard]] Request with_json(std::string_view json) const;

        // Serializes through an ADL-visible to_json(const T&) returning JSON text.
        template <typename T>
            requires(!std::is_convertible_v<const T&, std::string_view>)
        [[nodiscard]] Request with_json(const T& value) const {
            const std::string json = to_json(value);
            return with_json(std::string_view(json));
        }

        [[nodiscard]] http::transport::Method method() const { return method_; }
        [[nodiscard]] const http::url::Url& url() const { return url_; }
        [[nodiscard]] const http::transport::Fields& headers() const { return headers_; }
        [[nodiscard]] const std::optional<std::string>& body() const { return body_; }

       private:
        http::transport::Method method_;
        http::url::Url url_;
        http::transport::Fields headers_;
        std::optional<std::string> body_;
    };

}  // namespace http::model

#endif
