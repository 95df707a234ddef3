#include "abi_converter.hpp"

#include <string>

namespace extension::abi {
    namespace {
        const char* scheme_c_str(const http::transport::Scheme& scheme) {
            switch (scheme.kind_) {
                case http::transport::SchemeKind::HTTP:
                    return "http";
                case http::transport::SchemeKind::HTTPS:
                    return "https";
                case http::transport::SchemeKind::OTHER:
                    return scheme.other_.c_str();
            }
            return scheme.other_.c_str();
        }

        constexpr int32_t UNKNOWN_DIMENSION = -1;
    }  // namespace

    void ABIConverter::reset() {
        c_series_cache_.clear();
        c_episodes_cache_.clear();
        c_filter_categories_cache_.clear();
        c_filters_cache_.clear();
        c_videos_cache_.clear();
        c_requests_cache_.clear();
        c_headers_cache_.clear();

        series_cache_.clear();
        episodes_cache_.clear();
        filter_categories_cache_.clear();
        videos_cache_.clear();
        error_message_cache_.clear();
    }

    const char* ABIConverter::to_c_string(const std::optional<std::string>& value) { return value ? value->c_str() : nullptr; }

    COutgoingRequest ABIConverter::to_c_request(const http::transport::OutgoingRequest& req) {
        auto& headers = c_headers_cache_.emplace_back();
        headers.reserve(req.headers_.size());
        for (const auto& [name, value] : req.headers_.entries()) {
            headers.emplace_back(CHeader{
                .name_ = name.c_str(),
                .value_ = value.data(),
                .value_len_ = value.size(),
            });
        }

        return COutgoingRequest{
            .method_ = http::transport::to_string(req.method_),
            .scheme_ = scheme_c_str(req.scheme_),
            .authority_ = req.authority_.c_str(),
            .path_with_query_ = req.path_with_query_.c_str(),
            .headers_ = headers.data(),
            .headers_count_ = headers.size(),
        };
    }

    const COutgoingRequest* ABIConverter::to_c_request(const std::optional<http::transport::OutgoingRequest>& req) {
        if (!req) {
            return nullptr;
        }
        return &c_requests_cache_.emplace_back(to_c_request(*req));
    }

    CSeries ABIConverter::to_c_series(const Series& series) {
        return CSeries{
            .id_ = series.id_.c_str(),
            .title_ = series.title_.c_str(),
            .poster_resource_ = to_c_request(series.poster_resource_),
            .synopsis_ = to_c_string(series.synopsis_),
            .type_ = to_c_string(series.type_),
        };
    }

    CEpisode ABIConverter::to_c_episode(const Episode& episode) {
        return CEpisode{
            .id_ = episode.id_.c_str(),
            .number_ = episode.number_,
            .title_ = to_c_string(episode.title_),
            .description_ = to_c_string(episode.description_),
            .thumbnail_resource_ = to_c_request(episode.thumbnail_resource_),
        };
    }

    CSeries ABIConverter::transform(Series series) { return to_c_series(series_cache_.emplace_back(std::move(series))); }

    CSeriesPage ABIConverter::transform(SeriesPage page) {
        const size_t first = series_cache_.size();
        for (auto& series : page.series_) {
            series_cache_.emplace_back(std::move(series));
        }

        c_series_cache_.clear();
        c_series_cache_.reserve(series_cache_.size() - first);
        for (size_t i = first; i < series_cache_.size(); ++i) {
            c_series_cache_.emplace_back(to_c_series(series_cache_[i]));
        }

        return CSeriesPage{
            .series_ = c_series_cache_.data(),
            .series_count_ = c_series_cache_.size(),
            .has_next_page_ = page.has_next_page_,
        };
    }

    CEpisodesPage ABIConverter::transform(EpisodesPage page) {
        const auto& stored = episodes_cache_.emplace_back(std::move(page));

        c_episodes_cache_.clear();
        c_episodes_cache_.reserve(stored.episodes_.size());
        for (const auto& episode : stored.episodes_) {
            c_episodes_cache_.emplace_back(to_c_episode(episode));
        }

        return CEpisodesPage{
            .episodes_ = c_episodes_cache_.data(),
            .episodes_count_ = c_episodes_cache_.size(),
            .has_next_page_ = stored.has_next_page_,
        };
    }

    const CFilterCategory* ABIConverter::transform(std::vector<FilterCategory> categories, size_t& out_count) {
        filter_categories_cache_ = std::move(categories);

        c_filter_categories_cache_.clear();
        c_filter_categories_cache_.reserve(filter_categories_cache_.size());
        for (const auto& category : filter_categories_cache_) {
            auto& filters = c_filters_cache_.emplace_back();
            filters.reserve(category.filters_.size());
            for (const auto& filter : category.filters_) {
                filters.emplace_back(CFilter{.id_ = filter.id_.c_str(), .display_name_ = filter.display_name_.c_str()});
            }

            c_filter_categories_cache_.emplace_back(CFilterCategory{
                .id_ = category.id_.c_str(),
                .display_name_ = category.display_name_.c_str(),
                .filters_ = filters.data(),
                .filters_count_ = filters.size(),
            });
        }

        out_count = c_filter_categories_cache_.size();
        return c_filter_categories_cache_.data();
    }

    const CVideo* ABIConverter::transform(std::vector<Video> videos, size_t& out_count) {
        videos_cache_ = std::move(videos);

        c_videos_cache_.clear();
        c_videos_cache_.reserve(videos_cache_.size());
        for (const auto& video : videos_cache_) {
            c_videos_cache_.emplace_back(CVideo{
                .video_resource_ = to_c_request(video.video_resource_),
                .server_name_ = video.server_name_.c_str(),
                .width_ = video.width_ ? int32_t{*video.width_} : UNKNOWN_DIMENSION,
                .height_ = video.height_ ? int32_t{*video.height_} : UNKNOWN_DIMENSION,
            });
        }

        out_count = c_videos_cache_.size();
        return c_videos_cache_.data();
    }

    CErrorCode ABIConverter::transform(const http::transport::ErrorCode& code) {
        error_message_cache_ = code.message_.value_or("");
        return CErrorCode{
            .kind_ = to_c_error_code_kind(code.kind_),
            .message_ = code.message_ ? error_message_cache_.c_str() : nullptr,
        };
    }

    std::vector<SearchFilter> ABIConverter::to_search_filters(const CSearchFilter* filters, size_t count) {
        std::vector<SearchFilter> out;
        if (filters == nullptr) {
            return out;
        }

        out.reserve(count);
        for (size_t i = 0; i < count; ++i) {
            SearchFilter filter{.id_ = filters[i].id_ != nullptr ? filters[i].id_ : "", .values_ = {}};
            for (size_t k = 0; k < filters[i].values_count_ && filters[i].values_ != nullptr; ++k) {
                if (filters[i].values_[k] != nullptr) {
                    filter.values_.emplace_back(filters[i].values_[k]);
                }
            }
            out.push_back(std::move(filter));
        }
        return out;
    }

    CErrorCodeKind ABIConverter::to_c_error_code_kind(http::transport::ErrorCodeKind kind) {
        using http::transport::ErrorCodeKind;
        switch (kind) {
            case ErrorCodeKind::DNS_TIMEOUT:
                return ERROR_CODE_DNS_TIMEOUT;
            case ErrorCodeKind::DNS_ERROR:
                return ERROR_CODE_DNS_ERROR;
            case ErrorCodeKind::DESTINATION_NOT_FOUND:
                return ERROR_CODE_DESTINATION_NOT_FOUND;
            case ErrorCodeKind::DESTINATION_UNAVAILABLE:
                return ERROR_CODE_DESTINATION_UNAVAILABLE;
            case ErrorCodeKind::DESTINATION_IP_UNROUTABLE:
                return ERROR_CODE_DESTINATION_IP_UNROUTABLE;
            case ErrorCodeKind::CONNECTION_REFUSED:
                return ERROR_CODE_CONNECTION_REFUSED;
            case ErrorCodeKind::CONNECTION_TERMINATED:
                return ERROR_CODE_CONNECTION_TERMINATED;
            case ErrorCodeKind::CONNECTION_TIMEOUT:
                return ERROR_CODE_CONNECTION_TIMEOUT;
            case ErrorCodeKind::CONNECTION_READ_TIMEOUT:
                return ERROR_CODE_CONNECTION_READ_TIMEOUT;
            case ErrorCodeKind::CONNECTION_WRITE_TIMEOUT:
                return ERROR_CODE_CONNECTION_WRITE_TIMEOUT;
            case ErrorCodeKind::TLS_PROTOCOL_ERROR:
                return ERROR_CODE_TLS_PROTOCOL_ERROR;
            case ErrorCodeKind::TLS_CERTIFICATE_ERROR:
                return ERROR_CODE_TLS_CERTIFICATE_ERROR;
            case ErrorCodeKind::HTTP_REQUEST_DENIED:
                return ERROR_CODE_HTTP_REQUEST_DENIED;
            case ErrorCodeKind::HTTP_REQUEST_BODY_SIZE:
                return ERROR_CODE_HTTP_REQUEST_BODY_SIZE;
            case ErrorCodeKind::HTTP_RESPONSE_INCOMPLETE:
                return ERROR_CODE_HTTP_RESPONSE_INCOMPLETE;
            case ErrorCodeKind::HTTP_PROTOCOL_ERROR:
                return ERROR_CODE_HTTP_PROTOCOL_ERROR;
            case ErrorCodeKind::HTTP_RESPONSE_TIMEOUT:
                return ERROR_CODE_HTTP_RESPONSE_TIMEOUT;
            case ErrorCodeKind::LOOP_DETECTED:
                return ERROR_CODE_LOOP_DETECTED;
            case ErrorCodeKind::CONFIGURATION_ERROR:
                return ERROR_CODE_CONFIGURATION_ERROR;
            case ErrorCodeKind::INTERNAL_ERROR:
                return ERROR_CODE_INTERNAL_ERROR;
        }
        return ERROR_CODE_INTERNAL_ERROR;
    }

}  // namespace extension::abi
