#ifndef NERO_KITSU_EXTENSION_INTERFACE_HPP
#define NERO_KITSU_EXTENSION_INTERFACE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace extension {

    // Capability set a host registers once per process. Calls keep no state
    // between them; every failure leaves as http::transport::TransportError.
    class IExtension {
       public:
        IExtension() = default;
        virtual ~IExtension() = default;
        IExtension(const IExtension&) = delete;
        IExtension& operator=(const IExtension&) = delete;
        IExtension(IExtension&&) = delete;
        IExtension& operator=(IExtension&&) = delete;

        [[nodiscard]] virtual std::vector<FilterCategory> filters() const = 0;
        [[nodiscard]] virtual SeriesPage search(const std::string& query, std::optional<uint16_t> page, const std::vector<SearchFilter>& filters) const = 0;
        [[nodiscard]] virtual Series get_series_info(const std::string& series_id) const = 0;
        [[nodiscard]] virtual EpisodesPage get_series_episodes(const std::string& series_id, std::optional<uint16_t> page) const = 0;
        [[nodiscard]] virtual std::vector<Video> get_series_videos(const std::string& series_id, const std::string& episode_id) const = 0;
    };

}  // namespace extension

#endif
