#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "src/extension/types.hpp"
#include "src/http/client/http_client.hpp"
#include "src/http/transport/curl_global.hpp"
#include "src/http/transport/curl_transport.hpp"
#include "src/http/transport/types.hpp"
#include "src/http/url/url.hpp"
#include "src/kitsu/kitsu_extension.hpp"
#include "src/utils/string_utils.hpp"

namespace {
    void print_usage() {
        std::cerr << "usage: nero_kitsu search <query> [page]\n"
                  << "       nero_kitsu series <series-id>\n"
                  << "       nero_kitsu episodes <series-id> [page]\n";
    }

    std::optional<uint16_t> parse_page(int argc, char** argv, int index) {
        if (argc <= index) {
            return std::nullopt;
        }
        auto page = string_utils::parse_u64(argv[index]);
        if (!page || *page > UINT16_MAX) {
            throw std::invalid_argument("invalid page: " + std::string(argv[index]));
        }
        return static_cast<uint16_t>(*page);
    }

    void print_series(const extension::Series& series) {
        std::cout << series.id_ << "\t" << series.title_;
        if (series.type_) {
            std::cout << "\t(" << *series.type_ << ")";
        }
        std::cout << "\n";
    }
}  // namespace

int main(int argc, char** argv) {
    if (argc < 3) {
        print_usage();
        return 1;
    }

    try {
        //
        // Collect
        //

        const std::string command = argv[1];
        const std::string argument = argv[2];

        kitsu::KitsuOptions options;
        if (const char* base_url = std::getenv("KITSU_URL"); base_url != nullptr && *base_url != '\0') {
            options.base_url_ = base_url;
        }
        if (const char* page_limit = std::getenv("KITSU_PAGE_LIMIT"); page_limit != nullptr) {
            auto limit = string_utils::parse_u64(page_limit);
            if (!limit || *limit == 0 || *limit > UINT16_MAX) {
                std::cerr << "KITSU_PAGE_LIMIT must be between 1 and " << UINT16_MAX << "\n";
                return 1;
            }
            options.page_limit_ = static_cast<uint16_t>(*limit);
        }

        http::transport::CurlGlobal curl_global;

        const auto base_url = http::url::Url::parse(options.base_url_);
        if (!base_url) {
            std::cerr << "KITSU_URL is not an absolute URL: " << options.base_url_ << "\n";
            return 1;
        }
        if (!http::transport::CurlGlobal::supports_protocol(base_url->scheme())) {
            std::cerr << "libcurl was built without " << base_url->scheme() << " support\n";
            return 1;
        }

        auto http = std::make_shared<http::client::HttpClient>(std::make_shared<http::transport::CurlTransport>());
        const kitsu::KitsuExtension extension(http, options);

        //
        // Run
        //

        if (command == "search") {
            const auto page = extension.search(argument, parse_page(argc, argv, 3), {});
            for (const auto& series : page.series_) {
                print_series(series);
            }
            std::cout << (page.has_next_page_ ? "more results available\n" : "no more results\n");
        } else if (command == "series") {
            const auto series = extension.get_series_info(argument);
            print_series(series);
            if (series.synopsis_) {
                std::cout << "\n" << *series.synopsis_ << "\n";
            }
        } else if (command == "episodes") {
            const auto page = extension.get_series_episodes(argument, parse_page(argc, argv, 3));
            for (const auto& episode : page.episodes_) {
                std::cout << episode.number_ << "\t" << episode.id_ << "\t" << episode.title_.value_or("-") << "\n";
            }
            std::cout << (page.has_next_page_ ? "more episodes available\n" : "no more episodes\n");
        } else {
            print_usage();
            return 1;
        }
    } catch (const http::transport::TransportError& e) {
        std::cerr << "HTTP Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
};
