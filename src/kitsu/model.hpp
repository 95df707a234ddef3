#ifndef NERO_KITSU_KITSU_MODEL_HPP
#define NERO_KITSU_KITSU_MODEL_HPP

#include <simdjson.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../extension/types.hpp"

namespace kitsu {

    struct ImageResource {
        std::optional<std::string> original_;
    };

    struct AnimeAttributes {
        std::string canonical_title_;
        std::optional<std::string> synopsis_;
        std::optional<ImageResource> poster_image_;
    };

    struct AnimeData {
        std::string id_;
        std::string type_;
        AnimeAttributes attributes_;

        [[nodiscard]] extension::Series to_series() const;
    };

    struct EpisodeAttributes {
        uint16_t number_{};
        std::optional<std::string> canonical_title_;
        std::optional<std::string> synopsis_;
        std::optional<ImageResource> thumbnail_;
    };

    struct EpisodeData {
        std::string id_;
        EpisodeAttributes attributes_;

        [[nodiscard]] extension::Episode to_episode() const;
    };

    struct Links {
        std::optional<std::string> next_;
    };

    // Decoders throw simdjson::simdjson_error on malformed input or a schema
    // mismatch. A JSON null counts as an absent optional.
    void decode(simdjson::ondemand::value value, ImageResource& out);
    void decode(simdjson::ondemand::value value, AnimeData& out);
    void decode(simdjson::ondemand::value value, EpisodeData& out);
    void decode(simdjson::ondemand::value value, Links& out);

    template <typename T>
    void decode(simdjson::ondemand::value value, std::vector<T>& out) {
        for (auto element : value.get_array()) {
            T item{};
            decode(element.value(), item);
            out.push_back(std::move(item));
        }
    }

    template <typename T>
    std::optional<T> decode_optional(simdjson::ondemand::object& obj, std::string_view key) {
        auto field = obj[key];
        if (field.error() == simdjson::NO_SUCH_FIELD) {
            return std::nullopt;
        }

        simdjson::ondemand::value value = field.value();
        const simdjson::ondemand::json_type type = value.type();
        if (type == simdjson::ondemand::json_type::null) {
            return std::nullopt;
        }

        T out{};
        decode(value, out);
        return out;
    }

    std::optional<std::string> optional_string(simdjson::ondemand::object& obj, std::string_view key);

    // Top level JSON:API envelope: {"data": ..., "links": {...}}.
    template <typename T>
    struct ApiResponse {
        T data_;
        std::optional<Links> links_;

        static ApiResponse from_json(simdjson::ondemand::document& doc) {
            simdjson::ondemand::object obj = doc.get_object();

            ApiResponse out{};
            decode(obj["data"].value(), out.data_);
            out.links_ = decode_optional<Links>(obj, "links");
            return out;
        }

        [[nodiscard]] bool has_next_page() const { return links_ && links_->next_; }
    };

    using SearchApiResponse = ApiResponse<std::vector<AnimeData>>;
    using AnimeApiResponse = ApiResponse<AnimeData>;
    using EpisodesApiResponse = ApiResponse<std::vector<EpisodeData>>;

}  // namespace kitsu

#endif
