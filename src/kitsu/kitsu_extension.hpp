#ifndef NERO_KITSU_KITSU_EXTENSION_HPP
#define NERO_KITSU_KITSU_EXTENSION_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../extension/interface.hpp"
#include "../extension/types.hpp"
#include "../http/client/interface.hpp"
#include "../http/model/request.hpp"
#include "../utils/constants.hpp"

namespace kitsu {

    struct KitsuOptions {
        std::string base_url_ = constants::KITSU_URL;
        uint16_t page_limit_ = constants::DEFAULT_PAGE_LIMIT;
    };

    class KitsuExtension : public extension::IExtension {
       public:
        explicit KitsuExtension(std::shared_ptr<http::client::IHttpClient> http, KitsuOptions options = {});

        [[nodiscard]] std::vector<extension::FilterCategory> filters() const override;
        [[nodiscard]] extension::SeriesPage search(const std::string& query, std::optional<uint16_t> page,
                                                   const std::vector<extension::SearchFilter>& filters) const override;
        [[nodiscard]] extension::Series get_series_info(const std::string& series_id) const override;
        [[nodiscard]] extension::EpisodesPage get_series_episodes(const std::string& series_id, std::optional<uint16_t> page) const override;
        [[nodiscard]] std::vector<extension::Video> get_series_videos(const std::string& series_id, const std::string& episode_id) const override;

        [[nodiscard]] std::string search_url(const std::string& query, std::optional<uint16_t> page) const;
        [[nodiscard]] std::string series_url(const std::string& series_id) const;
        [[nodiscard]] std::string episodes_url(const std::string& series_id, std::optional<uint16_t> page) const;

       private:
        [[nodiscard]] http::model::Request build_request(const std::string& url) const;
        [[nodiscard]] std::string page_query(std::optional<uint16_t> page) const;

        template <typename T>
        [[nodiscard]] T fetch(const std::string& url) const;

        std::shared_ptr<http::client::IHttpClient> http_;
        KitsuOptions options_;
    };

}  // namespace kitsu

#endif
