#ifndef NERO_KITSU_EXTENSION_TYPES_HPP
#define NERO_KITSU_EXTENSION_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../http/transport/types.hpp"

namespace extension {

    struct Series {
        std::string id_;
        std::string title_;
        // Ready-made GET for the poster image.
        std::optional<http::transport::OutgoingRequest> poster_resource_;
        std::optional<std::string> synopsis_;
        std::optional<std::string> type_;
    };

    struct Episode {
        std::string id_;
        uint16_t number_{};
        std::optional<std::string> title_;
        std::optional<std::string> description_;
        std::optional<http::transport::OutgoingRequest> thumbnail_resource_;
    };

    struct SeriesPage {
        std::vector<Series> series_;
        bool has_next_page_{};
    };

    struct EpisodesPage {
        std::vector<Episode> episodes_;
        bool has_next_page_{};
    };

    struct Video {
        http::transport::OutgoingRequest video_resource_;
        std::string server_name_;
        std::optional<uint16_t> width_;
        std::optional<uint16_t> height_;
    };

    struct Filter {
        std::string id_;
        std::string display_name_;
    };

    struct FilterCategory {
        std::string id_;
        std::string display_name_;
        std::vector<Filter> filters_;
    };

    struct SearchFilter {
        std::string id_;
        std::vector<std::string> values_;
    };

}  // namespace extension

#endif
