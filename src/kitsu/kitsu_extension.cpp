#include "kitsu_extension.hpp"

#include <algorithm>
#include <iterator>
#include <ranges>
#include <string>

#include "../http/error/client_error.hpp"
#include "../http/transport/types.hpp"
#include "../http/url/url.hpp"
#include "../utils/string_utils.hpp"
#include "model.hpp"

namespace kitsu {
    namespace {
        [[noreturn]] void not_implemented() {
            throw http::transport::TransportError(
                http::transport::ErrorCode{.kind_ = http::transport::ErrorCodeKind::INTERNAL_ERROR, .message_ = constants::NOT_IMPLEMENTED});
        }
    }  // namespace

    KitsuExtension::KitsuExtension(std::shared_ptr<http::client::IHttpClient> http, KitsuOptions options)
        : http_(std::move(http)), options_(std::move(options)) {
        while (!options_.base_url_.empty() && options_.base_url_.back() == '/') {
            options_.base_url_.pop_back();
        }
        if (options_.page_limit_ == 0) {
            options_.page_limit_ = constants::DEFAULT_PAGE_LIMIT;
        }
    }

    std::string KitsuExtension::page_query(std::optional<uint16_t> page) const {
        // Pages are 1-based; a missing page or page 0 means the first one.
        const uint32_t page_index = std::max<uint32_t>(page.value_or(1), 1) - 1;
        const uint32_t offset = page_index * options_.page_limit_;
        return "page[limit]=" + std::to_string(options_.page_limit_) + "&page[offset]=" + std::to_string(offset);
    }

    std::string KitsuExtension::search_url(const std::string& query, std::optional<uint16_t> page) const {
        return options_.base_url_ + "/anime?filter[text]=" + string_utils::url_encode(query) + "&" + page_query(page);
    }

    std::string KitsuExtension::series_url(const std::string& series_id) const {
        return options_.base_url_ + "/anime/" + string_utils::url_encode(series_id);
    }

    std::string KitsuExtension::episodes_url(const std::string& series_id, std::optional<uint16_t> page) const {
        return options_.base_url_ + "/episodes?filter[mediaId]=" + string_utils::url_encode(series_id) + "&" + page_query(page);
    }

    http::model::Request KitsuExtension::build_request(const std::string& url) const {
        auto parsed = http::url::Url::parse(url);
        if (!parsed) {
            throw http::transport::TransportError(
                http::transport::ErrorCode{.kind_ = http::transport::ErrorCodeKind::CONFIGURATION_ERROR, .message_ = "Invalid URL: " + url});
        }

        return http::model::Request(http::transport::Method::GET, *parsed).with_header(constants::ACCEPT, constants::JSON_API_CONTENT_TYPE);
    }

    template <typename T>
    T KitsuExtension::fetch(const std::string& url) const {
        try {
            return http_->send(build_request(url)).template json<T>();
        } catch (const http::error::ClientError& e) {
            throw http::transport::TransportError(http::error::to_error_code(e));
        }
    }

    std::vector<extension::FilterCategory> KitsuExtension::filters() const { not_implemented(); }

    extension::SeriesPage KitsuExtension::search(const std::string& query, std::optional<uint16_t> page,
                                                 const std::vector<extension::SearchFilter>& /*filters*/) const {
        const auto response = fetch<SearchApiResponse>(search_url(query, page));

        extension::SeriesPage out{};
        out.series_.reserve(response.data_.size());
        std::ranges::transform(response.data_, std::back_inserter(out.series_), [](const AnimeData& anime) { return anime.to_series(); });
        out.has_next_page_ = response.has_next_page();
        return out;
    }

    extension::Series KitsuExtension::get_series_info(const std::string& series_id) const {
        return fetch<AnimeApiResponse>(series_url(series_id)).data_.to_series();
    }

    extension::EpisodesPage KitsuExtension::get_series_episodes(const std::string& series_id, std::optional<uint16_t> page) const {
        const auto response = fetch<EpisodesApiResponse>(episodes_url(series_id, page));

        extension::EpisodesPage out{};
        out.episodes_.reserve(response.data_.size());
        std::ranges::transform(response.data_, std::back_inserter(out.episodes_), [](const EpisodeData& episode) { return episode.to_episode(); });
        out.has_next_page_ = response.has_next_page();
        return out;
    }

    std::vector<extension::Video> KitsuExtension::get_series_videos(const std::string& /*series_id*/, const std::string& /*episode_id*/) const {
        not_implemented();
    }

}  // namespace kitsu
