//
// Created by Daniel Griffiths on 11/1/25.
//

#include "string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <string>

namespace string_utils {
    namespace {
        constexpr const char* REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";
        constexpr const char* HEX_DIGITS = "0123456789ABCDEF";

        bool is_continuation(unsigned char c) { return (c & 0xC0U) == 0x80U; }
    }  // namespace

    size_t write_to_string(const char *ptr, size_t size, size_t nmemb, void *userdata) {
        auto *body = static_cast<std::string *>(userdata);
        const size_t total = size * nmemb;
        body->append(ptr, total);
        return total;
    }

    bool ieq(std::string_view a, std::string_view b) {
        return a.size() == b.size() &&
               std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) { return std::tolower(x) == std::tolower(y); });
    }

    std::string to_lower(std::string_view s) {
        std::string out(s);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return out;
    }

    std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) == 0; }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c) == 0; }).base(), s.end());
        return s;
    }

    std::optional<uint64_t> parse_u64(std::string_view s) {
        uint64_t value = 0;
        const auto* first = s.data();
        const auto* last = s.data() + s.size();
        auto [ptr, ec] = std::from_chars(first, last, value, 10);
        if (s.empty() || ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    std::string url_encode(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        for (const unsigned char c : s) {
            if (std::isalnum(c) != 0 || c == '-' || c == '.' || c == '_' || c == '~') {
                out.push_back(static_cast<char>(c));
                continue;
            }
            out.push_back('%');
            out.push_back(HEX_DIGITS[c >> 4U]);
            out.push_back(HEX_DIGITS[c & 0x0FU]);
        }
        return out;
    }

    std::string utf8_lossy(std::string_view bytes) {
        std::string out;
        out.reserve(bytes.size());

        size_t i = 0;
        while (i < bytes.size()) {
            const auto lead = static_cast<unsigned char>(bytes[i]);

            if (lead < 0x80U) {
                out.push_back(static_cast<char>(lead));
                ++i;
                continue;
            }

            size_t needed = 0;
            unsigned char lower = 0x80U;
            unsigned char upper = 0xBFU;
            if (lead >= 0xC2U && lead <= 0xDFU) {
                needed = 1;
            } else if (lead >= 0xE0U && lead <= 0xEFU) {
                needed = 2;
                if (lead == 0xE0U) {
                    lower = 0xA0U;
                } else if (lead == 0xEDU) {
                    upper = 0x9FU;
                }
            } else if (lead >= 0xF0U && lead <= 0xF4U) {
                needed = 3;
                if (lead == 0xF0U) {
                    lower = 0x90U;
                } else if (lead == 0xF4U) {
                    upper = 0x8FU;
                }
            } else {
                out += REPLACEMENT_CHARACTER;
                ++i;
                continue;
            }

            // Only the first continuation byte has a narrowed range.
            size_t consumed = 1;
            bool valid = true;
            for (size_t k = 0; k < needed; ++k) {
                if (i + consumed >= bytes.size()) {
                    valid = false;
                    break;
                }
                const auto c = static_cast<unsigned char>(bytes[i + consumed]);
                const bool in_range = k == 0 ? (c >= lower && c <= upper) : is_continuation(c);
                if (!in_range) {
                    valid = false;
                    break;
                }
                ++consumed;
            }

            if (valid) {
                out.append(bytes.substr(i, consumed));
            } else {
                out += REPLACEMENT_CHARACTER;
            }
            i += consumed;
        }

        return out;
    }
}  // namespace string_utils
