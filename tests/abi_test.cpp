#include "../src/extension/abi/abi.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/extension/abi/abi_converter.hpp"
#include "../src/extension/abi/export.hpp"
#include "../src/http/client/outgoing.hpp"
#include "../src/http/url/url.hpp"

using extension::abi::ABIConverter;
using http::transport::ErrorCode;
using http::transport::ErrorCodeKind;
using http::transport::TransportError;

namespace {
    // Records what reached it and answers from canned values.
    class StubExtension : public extension::IExtension {
       public:
        struct Calls {
            std::string query_;
            std::optional<uint16_t> page_;
            std::vector<extension::SearchFilter> filters_;
            std::string series_id_;
        };

        explicit StubExtension(std::shared_ptr<Calls> calls) : calls_(std::move(calls)) {}

        [[nodiscard]] std::vector<extension::FilterCategory> filters() const override {
            return {extension::FilterCategory{
                .id_ = "genre",
                .display_name_ = "Genre",
                .filters_ = {{.id_ = "action", .display_name_ = "Action"}, {.id_ = "drama", .display_name_ = "Drama"}},
            }};
        }

        [[nodiscard]] extension::SeriesPage search(const std::string& query, std::optional<uint16_t> page,
                                                   const std::vector<extension::SearchFilter>& filters) const override {
            calls_->query_ = query;
            calls_->page_ = page;
            calls_->filters_ = filters;

            auto poster = http::url::Url::parse("https://media.kitsu.io/poster.jpg");
            return extension::SeriesPage{
                .series_ = {extension::Series{
                                .id_ = "1",
                                .title_ = "Cowboy Bebop",
                                .poster_resource_ = http::client::from_url(*poster, http::transport::Method::GET, http::transport::Fields{}),
                                .synopsis_ = "Bounty hunters.",
                                .type_ = "anime",
                            },
                            extension::Series{.id_ = "2", .title_ = "Trigun", .poster_resource_ = {}, .synopsis_ = {}, .type_ = {}}},
                .has_next_page_ = true,
            };
        }

        [[nodiscard]] extension::Series get_series_info(const std::string& series_id) const override {
            calls_->series_id_ = series_id;
            throw TransportError(ErrorCode{.kind_ = ErrorCodeKind::CONNECTION_REFUSED, .message_ = "refused"});
        }

        [[nodiscard]] extension::EpisodesPage get_series_episodes(const std::string& series_id, std::optional<uint16_t> page) const override {
            calls_->series_id_ = series_id;
            calls_->page_ = page;
            return extension::EpisodesPage{
                .episodes_ = {extension::Episode{.id_ = "100", .number_ = 1, .title_ = "Asteroid Blues", .description_ = {}, .thumbnail_resource_ = {}}},
                .has_next_page_ = false,
            };
        }

        [[nodiscard]] std::vector<extension::Video> get_series_videos(const std::string& /*series_id*/,
                                                                      const std::string& /*episode_id*/) const override {
            throw std::out_of_range("no videos");
        }

       private:
        std::shared_ptr<Calls> calls_;
    };

    class ExportTest : public ::testing::Test {
       protected:
        void SetUp() override { export_ = extension::abi::make_export(std::make_unique<StubExtension>(calls_)); }

        void TearDown() override { export_.vtable_.destroy(export_.instance_); }

        std::shared_ptr<StubExtension::Calls> calls_ = std::make_shared<StubExtension::Calls>();
        ExtensionExport export_{};
    };
}  // namespace

TEST_F(ExportTest, ExportCarriesApiVersion) {
    EXPECT_EQ(export_.api_version_, EXTENSION_API_VERSION);
    EXPECT_NE(export_.instance_, nullptr);
}

TEST_F(ExportTest, SearchCrossesBoundary) {
    const char* const genres[] = {"action", "comedy"};
    const CSearchFilter filter{.id_ = "genre", .values_ = genres, .values_count_ = 2};
    const uint16_t page = 3;
    CSeriesPage out{};

    const auto result = export_.vtable_.search(export_.instance_, "bebop", &page, &filter, 1, &out);

    ASSERT_EQ(result.code_, 0);
    EXPECT_EQ(result.error_.kind_, ERROR_CODE_NONE);
    EXPECT_EQ(result.error_.message_, nullptr);
    EXPECT_EQ(calls_->query_, "bebop");
    EXPECT_EQ(calls_->page_, 3);
    ASSERT_EQ(calls_->filters_.size(), 1U);
    EXPECT_EQ(calls_->filters_[0].id_, "genre");
    EXPECT_EQ(calls_->filters_[0].values_, (std::vector<std::string>{"action", "comedy"}));

    ASSERT_EQ(out.series_count_, 2U);
    EXPECT_TRUE(out.has_next_page_);
    EXPECT_STREQ(out.series_[0].title_, "Cowboy Bebop");
    EXPECT_STREQ(out.series_[0].synopsis_, "Bounty hunters.");
    EXPECT_STREQ(out.series_[0].type_, "anime");
    ASSERT_NE(out.series_[0].poster_resource_, nullptr);
    EXPECT_STREQ(out.series_[0].poster_resource_->method_, "GET");
    EXPECT_STREQ(out.series_[0].poster_resource_->scheme_, "https");
    EXPECT_STREQ(out.series_[0].poster_resource_->authority_, "media.kitsu.io");
    EXPECT_STREQ(out.series_[0].poster_resource_->path_with_query_, "/poster.jpg");
    EXPECT_EQ(out.series_[0].poster_resource_->headers_count_, 0U);

    EXPECT_STREQ(out.series_[1].id_, "2");
    EXPECT_EQ(out.series_[1].poster_resource_, nullptr);
    EXPECT_EQ(out.series_[1].synopsis_, nullptr);
    EXPECT_EQ(out.series_[1].type_, nullptr);
}

TEST_F(ExportTest, NullPageMeansNoPage) {
    CEpisodesPage out{};

    const auto result = export_.vtable_.get_series_episodes(export_.instance_, "1", nullptr, &out);

    ASSERT_EQ(result.code_, 0);
    EXPECT_FALSE(calls_->page_.has_value());
    ASSERT_EQ(out.episodes_count_, 1U);
    EXPECT_EQ(out.episodes_[0].number_, 1);
    EXPECT_STREQ(out.episodes_[0].title_, "Asteroid Blues");
    EXPECT_EQ(out.episodes_[0].thumbnail_resource_, nullptr);
    EXPECT_FALSE(out.has_next_page_);
}

TEST_F(ExportTest, FiltersCrossBoundary) {
    const CFilterCategory* categories = nullptr;
    size_t count = 0;

    const auto result = export_.vtable_.filters(export_.instance_, &categories, &count);

    ASSERT_EQ(result.code_, 0);
    ASSERT_EQ(count, 1U);
    EXPECT_STREQ(categories[0].display_name_, "Genre");
    ASSERT_EQ(categories[0].filters_count_, 2U);
    EXPECT_STREQ(categories[0].filters_[1].id_, "drama");
}

TEST_F(ExportTest, TransportErrorBecomesErrorCode) {
    CSeries out{};

    const auto result = export_.vtable_.get_series_info(export_.instance_, "42", &out);

    EXPECT_NE(result.code_, 0);
    EXPECT_EQ(calls_->series_id_, "42");
    EXPECT_EQ(result.error_.kind_, ERROR_CODE_CONNECTION_REFUSED);
    EXPECT_STREQ(result.error_.message_, "refused");
}

TEST_F(ExportTest, OtherExceptionsBecomeInternalError) {
    const CVideo* videos = nullptr;
    size_t count = 0;

    const auto result = export_.vtable_.get_series_videos(export_.instance_, "1", "100", &videos, &count);

    EXPECT_NE(result.code_, 0);
    EXPECT_EQ(result.error_.kind_, ERROR_CODE_INTERNAL_ERROR);
    EXPECT_STREQ(result.error_.message_, "no videos");
}

TEST(CreateExtensionTest, RejectsMissingContext) { EXPECT_EQ(create_extension(nullptr).instance_, nullptr); }

TEST(CreateExtensionTest, RejectsVersionMismatch) {
    const HostContext ctx{.api_version_ = EXTENSION_API_VERSION + 1, .base_url_ = nullptr, .page_limit_ = 0};
    EXPECT_EQ(create_extension(&ctx).instance_, nullptr);
}

TEST(CreateExtensionTest, CreatesKitsuInstance) {
    const HostContext ctx{.api_version_ = EXTENSION_API_VERSION, .base_url_ = "http://127.0.0.1:1", .page_limit_ = 5};

    auto created = create_extension(&ctx);
    ASSERT_NE(created.instance_, nullptr);

    const CFilterCategory* categories = nullptr;
    size_t count = 0;
    const auto result = created.vtable_.filters(created.instance_, &categories, &count);
    EXPECT_NE(result.code_, 0);
    EXPECT_EQ(result.error_.kind_, ERROR_CODE_INTERNAL_ERROR);
    EXPECT_STREQ(result.error_.message_, "Not implemented");

    created.vtable_.destroy(created.instance_);
}

TEST(ABIConverterTest, ErrorKindsKeepTheirOrder) {
    EXPECT_EQ(ABIConverter::to_c_error_code_kind(ErrorCodeKind::DNS_TIMEOUT), ERROR_CODE_DNS_TIMEOUT);
    EXPECT_EQ(ABIConverter::to_c_error_code_kind(ErrorCodeKind::LOOP_DETECTED), ERROR_CODE_LOOP_DETECTED);
    EXPECT_EQ(ABIConverter::to_c_error_code_kind(ErrorCodeKind::INTERNAL_ERROR), ERROR_CODE_INTERNAL_ERROR);
}

TEST(ABIConverterTest, SearchFiltersSkipNullValues) {
    const char* const values[] = {"a", nullptr, "b"};
    const CSearchFilter filters[] = {{.id_ = "genre", .values_ = values, .values_count_ = 3}, {.id_ = nullptr, .values_ = nullptr, .values_count_ = 0}};

    const auto converted = ABIConverter::to_search_filters(filters, 2);

    ASSERT_EQ(converted.size(), 2U);
    EXPECT_EQ(converted[0].values_, (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(converted[1].id_.empty());
    EXPECT_TRUE(ABIConverter::to_search_filters(nullptr, 4).empty());
}
