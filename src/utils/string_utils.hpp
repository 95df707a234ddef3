//
// Created by Daniel Griffiths on 11/1/25.
//

#ifndef NERO_KITSU_STRING_UTILS_HPP
#define NERO_KITSU_STRING_UTILS_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace string_utils {
    size_t write_to_string(const char* ptr, size_t size, size_t nmemb, void* userdata);

    bool ieq(std::string_view a, std::string_view b);

    std::string to_lower(std::string_view s);

    std::string trim(std::string s);

    std::optional<uint64_t> parse_u64(std::string_view s);

    // Percent-encodes everything outside the RFC 3986 unreserved set.
    std::string url_encode(std::string_view s);

    // Invalid sequences become U+FFFD, one per maximal invalid subsequence.
    std::string utf8_lossy(std::string_view bytes);
}  // namespace string_utils

#endif
