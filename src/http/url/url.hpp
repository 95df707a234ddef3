#ifndef NERO_KITSU_URL_HPP
#define NERO_KITSU_URL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace http::url {

    // Absolute URL split into the parts an outgoing request needs. Parsing is
    // delegated to libcurl's URL API; the parsed parts are kept as plain
    // strings so a Url copies like any value.
    class Url {
       public:
        // std::nullopt for anything curl rejects, relative references included.
        static std::optional<Url> parse(std::string_view text);

        [[nodiscard]] const std::string& scheme() const { return scheme_; }
        [[nodiscard]] const std::string& host() const { return host_; }
        [[nodiscard]] std::optional<uint16_t> port() const { return port_; }
        [[nodiscard]] std::string authority() const;
        [[nodiscard]] const std::string& path() const { return path_; }
        [[nodiscard]] const std::optional<std::string>& query() const { return query_; }
        [[nodiscard]] const std::string& href() const { return href_; }

        bool operator==(const Url&) const = default;

       private:
        Url() = default;

        std::string scheme_;
        std::string host_;
        std::optional<uint16_t> port_;
        std::string path_;
        std::optional<std::string> query_;
        std::string href_;
    };

}  // namespace http::url

#endif
