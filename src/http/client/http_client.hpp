//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_HTTP_CLIENT_HPP
#define NERO_KITSU_HTTP_CLIENT_HPP

#include <memory>
#include <optional>

#include "../model/request.hpp"
#include "../model/response.hpp"
#include "../transport/interface.hpp"
#include "../url/url.hpp"
#include "interface.hpp"

namespace http::client {

    class HttpClient : public IHttpClient {
       public:
        explicit HttpClient(std::shared_ptr<http::transport::IOutgoingHandler> handler);

        // One exchange, plus at most one more if the response names a
        // parseable Location. The second response is final whatever it says.
        http::model::Response send(http::model::Request req) override;

        static std::optional<http::url::Url> redirect_target(const http::model::Response& resp);

       private:
        [[nodiscard]] http::model::Response execute_request(const http::model::Request& req, const http::url::Url& url) const;
        static void write_body(http::transport::OutgoingBody& body, std::string_view bytes);

        std::shared_ptr<http::transport::IOutgoingHandler> handler_;
    };

}  // namespace http::client

#endif
