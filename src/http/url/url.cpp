#include "url.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::url {
    namespace {
        constexpr uint16_t HTTP_DEFAULT_PORT = 80;
        constexpr uint16_t HTTPS_DEFAULT_PORT = 443;

        using CurlUrlHandle = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

        std::optional<std::string> get_part(CURLU* handle, CURLUPart part) {
            char* raw = nullptr;
            if (curl_url_get(handle, part, &raw, 0) != CURLUE_OK || raw == nullptr) {
                return std::nullopt;
            }
            std::string out(raw);
            curl_free(raw);
            return out;
        }

        std::optional<uint16_t> default_port(const std::string& scheme) {
            if (scheme == "http") {
                return HTTP_DEFAULT_PORT;
            }
            if (scheme == "https") {
                return HTTPS_DEFAULT_PORT;
            }
            return std::nullopt;
        }
    }  // namespace

    std::optional<Url> Url::parse(std::string_view text) {
        CurlUrlHandle handle(curl_url(), &curl_url_cleanup);
        if (!handle) {
            return std::nullopt;
        }

        const std::string input(text);
        if (curl_url_set(handle.get(), CURLUPART_URL, input.c_str(), CURLU_NON_SUPPORT_SCHEME) != CURLUE_OK) {
            return std::nullopt;
        }

        auto scheme = get_part(handle.get(), CURLUPART_SCHEME);
        auto host = get_part(handle.get(), CURLUPART_HOST);
        auto href = get_part(handle.get(), CURLUPART_URL);
        if (!scheme || !host || !href) {
            return std::nullopt;
        }

        Url out;
        out.scheme_ = string_utils::to_lower(*scheme);
        out.host_ = std::move(*host);
        out.href_ = std::move(*href);
        out.path_ = get_part(handle.get(), CURLUPART_PATH).value_or("/");
        if (out.path_.empty()) {
            out.path_ = "/";
        }
        out.query_ = get_part(handle.get(), CURLUPART_QUERY);

        if (auto raw_port = get_part(handle.get(), CURLUPART_PORT)) {
            auto port = string_utils::parse_u64(*raw_port);
            if (!port || *port > UINT16_MAX) {
                return std::nullopt;
            }
            if (default_port(out.scheme_) != static_cast<uint16_t>(*port)) {
                out.port_ = static_cast<uint16_t>(*port);
            }
        }

        return out;
    }

    std::string Url::authority() const {
        if (!port_) {
            return host_;
        }
        return host_ + ":" + std::to_string(*port_);
    }

}  // namespace http::url
