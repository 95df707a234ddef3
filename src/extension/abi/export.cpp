#include "export.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <string>

#include "../../http/client/http_client.hpp"
#include "../../http/transport/curl_transport.hpp"
#include "../../kitsu/kitsu_extension.hpp"
#include "abi_converter.hpp"

namespace extension::abi {
    namespace {
        struct ExtensionInstance {
            std::unique_ptr<http::transport::CurlGlobal> curl_global_;
            std::unique_ptr<IExtension> extension_;
            ABIConverter converter_;
        };

        ExtensionInstance* as_instance(void* self) { return static_cast<ExtensionInstance*>(self); }

        ExtensionResult failure(ExtensionInstance* instance, const http::transport::ErrorCode& code) {
            return ExtensionResult{.code_ = 1, .error_ = instance->converter_.transform(code)};
        }

        // Nothing may unwind across the C boundary: every error becomes an
        // error code in the result.
        template <typename Fn>
        ExtensionResult guard(void* self, Fn&& fn) {
            auto* instance = as_instance(self);
            if (instance == nullptr) {
                return ExtensionResult{.code_ = 1, .error_ = CErrorCode{.kind_ = ERROR_CODE_INTERNAL_ERROR, .message_ = "null instance"}};
            }

            instance->converter_.reset();
            try {
                fn(*instance);
                return ExtensionResult{.code_ = 0, .error_ = CErrorCode{.kind_ = ERROR_CODE_NONE, .message_ = nullptr}};
            } catch (const http::transport::TransportError& e) {
                return failure(instance, e.code_);
            } catch (const std::exception& e) {
                return failure(instance, http::transport::ErrorCode{.kind_ = http::transport::ErrorCodeKind::INTERNAL_ERROR, .message_ = e.what()});
            }
        }

        std::optional<uint16_t> to_page(const uint16_t* page) {
            if (page == nullptr) {
                return std::nullopt;
            }
            return *page;
        }

        std::string to_string_arg(const char* value) { return value != nullptr ? std::string(value) : std::string{}; }

        void destroy(void* self) { delete as_instance(self); }

        ExtensionResult filters(void* self, const CFilterCategory** out, size_t* out_count) {
            return guard(self, [&](ExtensionInstance& instance) {
                size_t count = 0;
                const CFilterCategory* categories = instance.converter_.transform(instance.extension_->filters(), count);
                if (out != nullptr) {
                    *out = categories;
                }
                if (out_count != nullptr) {
                    *out_count = count;
                }
            });
        }

        ExtensionResult search(void* self, const char* query, const uint16_t* page, const CSearchFilter* c_filters, size_t filters_count, CSeriesPage* out) {
            return guard(self, [&](ExtensionInstance& instance) {
                auto page_result =
                    instance.extension_->search(to_string_arg(query), to_page(page), ABIConverter::to_search_filters(c_filters, filters_count));
                const CSeriesPage c_page = instance.converter_.transform(std::move(page_result));
                if (out != nullptr) {
                    *out = c_page;
                }
            });
        }

        ExtensionResult get_series_info(void* self, const char* series_id, CSeries* out) {
            return guard(self, [&](ExtensionInstance& instance) {
                const CSeries c_series = instance.converter_.transform(instance.extension_->get_series_info(to_string_arg(series_id)));
                if (out != nullptr) {
                    *out = c_series;
                }
            });
        }

        ExtensionResult get_series_episodes(void* self, const char* series_id, const uint16_t* page, CEpisodesPage* out) {
            return guard(self, [&](ExtensionInstance& instance) {
                const CEpisodesPage c_page =
                    instance.converter_.transform(instance.extension_->get_series_episodes(to_string_arg(series_id), to_page(page)));
                if (out != nullptr) {
                    *out = c_page;
                }
            });
        }

        ExtensionResult get_series_videos(void* self, const char* series_id, const char* episode_id, const CVideo** out, size_t* out_count) {
            return guard(self, [&](ExtensionInstance& instance) {
                size_t count = 0;
                const CVideo* videos =
                    instance.converter_.transform(instance.extension_->get_series_videos(to_string_arg(series_id), to_string_arg(episode_id)), count);
                if (out != nullptr) {
                    *out = videos;
                }
                if (out_count != nullptr) {
                    *out_count = count;
                }
            });
        }
    }  // namespace

    ExtensionExport make_export(std::unique_ptr<IExtension> extension, std::unique_ptr<http::transport::CurlGlobal> curl_global) {
        auto instance = std::make_unique<ExtensionInstance>();
        instance->curl_global_ = std::move(curl_global);
        instance->extension_ = std::move(extension);

        return ExtensionExport{
            .api_version_ = EXTENSION_API_VERSION,
            .instance_ = instance.release(),
            .vtable_ =
                ExtensionVTable{
                    .destroy = &destroy,
                    .filters = &filters,
                    .search = &search,
                    .get_series_info = &get_series_info,
                    .get_series_episodes = &get_series_episodes,
                    .get_series_videos = &get_series_videos,
                },
        };
    }

}  // namespace extension::abi

extern "C" ExtensionExport create_extension(const HostContext* ctx) {
    if (ctx == nullptr || ctx->api_version_ != EXTENSION_API_VERSION) {
        return ExtensionExport{.api_version_ = EXTENSION_API_VERSION, .instance_ = nullptr, .vtable_ = {}};
    }

    kitsu::KitsuOptions options;
    if (ctx->base_url_ != nullptr) {
        options.base_url_ = ctx->base_url_;
    }
    if (ctx->page_limit_ != 0) {
        options.page_limit_ = ctx->page_limit_;
    }

    try {
        auto curl_global = std::make_unique<http::transport::CurlGlobal>();
        auto http = std::make_shared<http::client::HttpClient>(std::make_shared<http::transport::CurlTransport>());
        return extension::abi::make_export(std::make_unique<kitsu::KitsuExtension>(std::move(http), std::move(options)), std::move(curl_global));
    } catch (const std::exception&) {
        // A null instance is the failure signal at this boundary.
        return ExtensionExport{.api_version_ = EXTENSION_API_VERSION, .instance_ = nullptr, .vtable_ = {}};
    }
}
