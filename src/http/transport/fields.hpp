#ifndef NERO_KITSU_TRANSPORT_FIELDS_HPP
#define NERO_KITSU_TRANSPORT_FIELDS_HPP

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http::transport {

    enum class HeaderErrorKind { INVALID_SYNTAX, FORBIDDEN };

    struct HeaderError : public std::runtime_error {
        HeaderErrorKind kind_;
        std::string name_;
        HeaderError(HeaderErrorKind kind, std::string name, const std::string& msg);
    };

    // Ordered header multimap. Names compare case-insensitively and keep the
    // spelling they were inserted with; values are raw bytes.
    class Fields {
       public:
        using Entry = std::pair<std::string, std::string>;

        Fields() = default;

        void append(std::string_view name, std::string_view value);
        // Host side only: response headers are taken as received.
        void append_raw(std::string_view name, std::string_view value);
        void set(std::string_view name, const std::vector<std::string>& values);
        void remove(std::string_view name);

        [[nodiscard]] std::vector<std::string> get(std::string_view name) const;
        [[nodiscard]] bool has(std::string_view name) const;
        [[nodiscard]] const std::vector<Entry>& entries() const;
        [[nodiscard]] size_t size() const;
        [[nodiscard]] bool empty() const;

        static bool is_valid_name(std::string_view name);
        static bool is_valid_value(std::string_view value);
        static bool is_forbidden(std::string_view name);

       private:
        static void validate(std::string_view name, std::string_view value);

        std::vector<Entry> entries_;
    };

}  // namespace http::transport

#endif
