//
// Created by Daniel Griffiths on 11/1/25.
//

#include "curl_global.hpp"

#include <curl/curl.h>

#include "../../utils/string_utils.hpp"
#include "curl_transport.hpp"
#include "types.hpp"

namespace http::transport {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw TransportError(to_error_code(rc, "Failed to initialize libcurl"));
        }
    }

    CurlGlobal::~CurlGlobal() { curl_global_cleanup(); }

    bool CurlGlobal::supports_protocol(std::string_view scheme) {
        const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
        if (info == nullptr || info->protocols == nullptr) {
            return false;
        }

        for (const char* const* protocol = info->protocols; *protocol != nullptr; ++protocol) {
            if (string_utils::ieq(*protocol, scheme)) {
                return true;
            }
        }
        return false;
    }

}  // namespace http::transport
