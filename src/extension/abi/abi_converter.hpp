#ifndef NERO_KITSU_EXTENSION_ABI_CONVERTER_HPP
#define NERO_KITSU_EXTENSION_ABI_CONVERTER_HPP

#include <deque>
#include <optional>
#include <string>
#include <vector>

#include "../../http/transport/types.hpp"
#include "../types.hpp"
#include "abi.h"

namespace extension::abi {

    // Owns everything the C views point at. The views stay valid until the
    // next transform or reset.
    class ABIConverter {
       public:
        void reset();

        [[nodiscard]] CSeries transform(Series series);
        [[nodiscard]] CSeriesPage transform(SeriesPage page);
        [[nodiscard]] CEpisodesPage transform(EpisodesPage page);
        [[nodiscard]] const CFilterCategory* transform(std::vector<FilterCategory> categories, size_t& out_count);
        [[nodiscard]] const CVideo* transform(std::vector<Video> videos, size_t& out_count);
        [[nodiscard]] CErrorCode transform(const http::transport::ErrorCode& code);

        [[nodiscard]] static std::vector<SearchFilter> to_search_filters(const CSearchFilter* filters, size_t count);
        [[nodiscard]] static CErrorCodeKind to_c_error_code_kind(http::transport::ErrorCodeKind kind);
        [[nodiscard]] static const char* to_c_string(const std::optional<std::string>& value);

       private:
        [[nodiscard]] COutgoingRequest to_c_request(const http::transport::OutgoingRequest& req);
        [[nodiscard]] const COutgoingRequest* to_c_request(const std::optional<http::transport::OutgoingRequest>& req);
        [[nodiscard]] CSeries to_c_series(const Series& series);
        [[nodiscard]] CEpisode to_c_episode(const Episode& episode);

        std::deque<Series> series_cache_;
        std::deque<EpisodesPage> episodes_cache_;
        std::vector<FilterCategory> filter_categories_cache_;
        std::vector<Video> videos_cache_;
        std::string error_message_cache_;

        std::vector<CSeries> c_series_cache_;
        std::vector<CEpisode> c_episodes_cache_;
        std::vector<CFilterCategory> c_filter_categories_cache_;
        std::deque<std::vector<CFilter>> c_filters_cache_;
        std::vector<CVideo> c_videos_cache_;
        std::deque<COutgoingRequest> c_requests_cache_;
        std::deque<std::vector<CHeader>> c_headers_cache_;
    };

}  // namespace extension::abi

#endif
