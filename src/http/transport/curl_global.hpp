//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_CURL_GLOBAL_HPP
#define NERO_KITSU_CURL_GLOBAL_HPP

#include <string_view>

namespace http::transport {

    // Process-wide libcurl state. Construct one before the first exchange and
    // keep it alive until the last one is gone.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        // Whether the linked libcurl was built with the given URL scheme.
        [[nodiscard]] static bool supports_protocol(std::string_view scheme);
    };

}  // namespace http::transport

#endif
