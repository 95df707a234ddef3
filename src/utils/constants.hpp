
#ifndef NERO_KITSU_CONSTANTS_HPP
#define NERO_KITSU_CONSTANTS_HPP

#include <cstddef>
#include <cstdint>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr size_t BODY_CHUNK_SIZE = 4096;
    inline constexpr uint16_t DEFAULT_PAGE_LIMIT = 10;
    inline constexpr const char* KITSU_URL = "https://kitsu.io/api/edge";
    inline constexpr const char* CONTENT_LENGTH = "Content-Length";
    inline constexpr const char* CONTENT_TYPE = "Content-Type";
    inline constexpr const char* LOCATION = "Location";
    inline constexpr const char* ACCEPT = "Accept";
    inline constexpr const char* JSON_CONTENT_TYPE = "application/json; charset=UTF-8";
    inline constexpr const char* JSON_API_CONTENT_TYPE = "application/vnd.api+json";
    inline constexpr const char* NOT_IMPLEMENTED = "Not implemented";

}  // namespace constants

#endif
