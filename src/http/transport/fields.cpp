#include "fields.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include "../../utils/string_utils.hpp"

namespace http::transport {
    namespace {
        constexpr std::array<std::string_view, 7> FORBIDDEN_HEADERS = {
            "connection", "keep-alive", "proxy-connection", "transfer-encoding", "upgrade", "host", "http2-settings",
        };

        bool is_token_char(unsigned char c) {
            if (std::isalnum(c) != 0) {
                return true;
            }
            switch (c) {
                case '!':
                case '#':
                case '$':
                case '%':
                case '&':
                case '\'':
                case '*':
                case '+':
                case '-':
                case '.':
                case '^':
                case '_':
                case '`':
                case '|':
                case '~':
                    return true;
                default:
                    return false;
            }
        }
    }  // namespace

    HeaderError::HeaderError(HeaderErrorKind kind, std::string name, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), name_(std::move(name)) {}

    bool Fields::is_valid_name(std::string_view name) {
        return !name.empty() && std::all_of(name.begin(), name.end(), [](unsigned char c) { return is_token_char(c); });
    }

    bool Fields::is_valid_value(std::string_view value) {
        return std::none_of(value.begin(), value.end(), [](char c) { return c == '\r' || c == '\n' || c == '\0'; });
    }

    bool Fields::is_forbidden(std::string_view name) {
        return std::ranges::any_of(FORBIDDEN_HEADERS, [name](std::string_view forbidden) { return string_utils::ieq(name, forbidden); });
    }

    void Fields::validate(std::string_view name, std::string_view value) {
        if (!is_valid_name(name)) {
            throw HeaderError(HeaderErrorKind::INVALID_SYNTAX, std::string(name), "invalid header name");
        }
        if (is_forbidden(name)) {
            throw HeaderError(HeaderErrorKind::FORBIDDEN, std::string(name), "forbidden header: " + std::string(name));
        }
        if (!is_valid_value(value)) {
            throw HeaderError(HeaderErrorKind::INVALID_SYNTAX, std::string(name), "invalid value for header: " + std::string(name));
        }
    }

    void Fields::append(std::string_view name, std::string_view value) {
        validate(name, value);
        entries_.emplace_back(std::string(name), std::string(value));
    }

    void Fields::append_raw(std::string_view name, std::string_view value) { entries_.emplace_back(std::string(name), std::string(value)); }

    void Fields::set(std::string_view name, const std::vector<std::string>& values) {
        for (const auto& value : values) {
            validate(name, value);
        }
        remove(name);
        for (const auto& value : values) {
            entries_.emplace_back(std::string(name), value);
        }
    }

    void Fields::remove(std::string_view name) {
        std::erase_if(entries_, [name](const Entry& entry) { return string_utils::ieq(entry.first, name); });
    }

    std::vector<std::string> Fields::get(std::string_view name) const {
        std::vector<std::string> out;
        for (const auto& [key, value] : entries_) {
            if (string_utils::ieq(key, name)) {
                out.push_back(value);
            }
        }
        return out;
    }

    bool Fields::has(std::string_view name) const {
        return std::ranges::any_of(entries_, [name](const Entry& entry) { return string_utils::ieq(entry.first, name); });
    }

    const std::vector<Fields::Entry>& Fields::entries() const { return entries_; }

    size_t Fields::size() const { return entries_.size(); }

    bool Fields::empty() const { return entries_.empty(); }

}  // namespace http::transport
