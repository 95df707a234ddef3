#include "model.hpp"

#include <simdjson.h>

#include <limits>
#include <string>

#include "../http/client/outgoing.hpp"
#include "../http/url/url.hpp"

namespace kitsu {
    namespace {
        std::optional<http::transport::OutgoingRequest> to_resource(const std::optional<ImageResource>& image) {
            if (!image || !image->original_) {
                return std::nullopt;
            }

            auto url = http::url::Url::parse(*image->original_);
            if (!url) {
                return std::nullopt;
            }

            return http::client::from_url(*url, http::transport::Method::GET, http::transport::Fields{});
        }
    }  // namespace

    std::optional<std::string> optional_string(simdjson::ondemand::object& obj, std::string_view key) {
        auto field = obj[key];
        if (field.error() == simdjson::NO_SUCH_FIELD) {
            return std::nullopt;
        }

        simdjson::ondemand::value value = field.value();
        const simdjson::ondemand::json_type type = value.type();
        if (type == simdjson::ondemand::json_type::null) {
            return std::nullopt;
        }

        return std::string(std::string_view(value.get_string()));
    }

    void decode(simdjson::ondemand::value value, ImageResource& out) {
        simdjson::ondemand::object obj = value.get_object();
        out.original_ = optional_string(obj, "original");
    }

    void decode(simdjson::ondemand::value value, Links& out) {
        simdjson::ondemand::object obj = value.get_object();
        out.next_ = optional_string(obj, "next");
    }

    void decode(simdjson::ondemand::value value, AnimeData& out) {
        simdjson::ondemand::object obj = value.get_object();

        out.id_ = std::string(std::string_view(obj["id"].get_string()));
        out.type_ = std::string(std::string_view(obj["type"].get_string()));

        simdjson::ondemand::object attributes = obj["attributes"].get_object();
        out.attributes_.canonical_title_ = std::string(std::string_view(attributes["canonicalTitle"].get_string()));
        out.attributes_.synopsis_ = optional_string(attributes, "synopsis");
        out.attributes_.poster_image_ = decode_optional<ImageResource>(attributes, "posterImage");
    }

    void decode(simdjson::ondemand::value value, EpisodeData& out) {
        simdjson::ondemand::object obj = value.get_object();

        out.id_ = std::string(std::string_view(obj["id"].get_string()));

        simdjson::ondemand::object attributes = obj["attributes"].get_object();
        const uint64_t number = attributes["number"].get_uint64();
        if (number > std::numeric_limits<uint16_t>::max()) {
            throw simdjson::simdjson_error(simdjson::NUMBER_OUT_OF_RANGE);
        }
        out.attributes_.number_ = static_cast<uint16_t>(number);
        out.attributes_.canonical_title_ = optional_string(attributes, "canonicalTitle");
        out.attributes_.synopsis_ = optional_string(attributes, "synopsis");
        out.attributes_.thumbnail_ = decode_optional<ImageResource>(attributes, "thumbnail");
    }

    extension::Series AnimeData::to_series() const {
        return extension::Series{
            .id_ = id_,
            .title_ = attributes_.canonical_title_,
            .poster_resource_ = to_resource(attributes_.poster_image_),
            .synopsis_ = attributes_.synopsis_,
            .type_ = type_,
        };
    }

    extension::Episode EpisodeData::to_episode() const {
        return extension::Episode{
            .id_ = id_,
            .number_ = attributes_.number_,
            .title_ = attributes_.canonical_title_,
            .description_ = attributes_.synopsis_,
            .thumbnail_resource_ = to_resource(attributes_.thumbnail_),
        };
    }
}  // namespace kitsu
