#include "../src/http/model/response.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "../src/http/error/client_error.hpp"
#include "../src/kitsu/model.hpp"
#include "support/fake_transport.hpp"

using http::error::ClientError;
using http::error::ClientErrorKind;
using http::model::Response;
using test_support::ChunkedInputStream;

namespace {
    Response make_response(std::vector<std::pair<std::string, std::string>> headers, std::vector<std::string> chunks,
                           std::shared_ptr<std::vector<uint64_t>> reads = nullptr) {
        http::transport::Fields fields;
        for (const auto& [name, value] : headers) {
            fields.append_raw(name, value);
        }
        return {200, std::move(fields), std::make_unique<ChunkedInputStream>(std::move(chunks), std::move(reads))};
    }
}  // namespace

TEST(ResponseTest, ContentLengthBoundsReadRegardlessOfChunking) {
    const std::string payload = "0123456789abcdefghij";

    for (const auto& chunks : std::vector<std::vector<std::string>>{
             {payload}, {"0", "123456789abcdefghij"}, {"01234", "56789", "abcde", "fghij"}, {"0123456789abcdefghi", "j"}}) {
        auto response = make_response({{"Content-Length", "20"}}, chunks);
        EXPECT_EQ(std::move(response).bytes(), payload);
    }
}

TEST(ResponseTest, EachReadIsBoundedByRemainingCeiling) {
    auto reads = std::make_shared<std::vector<uint64_t>>();
    auto response = make_response({{"Content-Length", "10"}}, {"abc", "defg", "hij"}, reads);

    EXPECT_EQ(std::move(response).bytes(), "abcdefghij");

    const std::vector<uint64_t> expected = {10, 7, 3};
    EXPECT_EQ(*reads, expected);
}

TEST(ResponseTest, DeclaredLengthIsACeiling) {
    auto response = make_response({{"Content-Length", "3"}}, {"abcdef"});
    EXPECT_EQ(std::move(response).bytes(), "abc");
}

TEST(ResponseTest, ShortStreamStopsAtClosure) {
    auto response = make_response({{"Content-Length", "100"}}, {"only", "this"});
    EXPECT_EQ(std::move(response).bytes(), "onlythis");
}

TEST(ResponseTest, MissingContentLengthReadsToExhaustion) {
    auto reads = std::make_shared<std::vector<uint64_t>>();
    auto response = make_response({}, {"A", "BB", "CCC"}, reads);

    EXPECT_EQ(std::move(response).bytes(), "ABBCCC");
    ASSERT_FALSE(reads->empty());
    EXPECT_EQ(reads->front(), UINT64_MAX);
}

TEST(ResponseTest, UnparseableContentLengthIsIgnored) {
    auto response = make_response({{"Content-Length", "lots"}}, {"A", "B"});
    EXPECT_FALSE(response.content_length().has_value());
    EXPECT_EQ(std::move(response).bytes(), "AB");
}

TEST(ResponseTest, ContentLengthUsesFirstValue) {
    auto response = make_response({{"content-length", "2"}, {"Content-Length", "5"}}, {"abcde"});
    EXPECT_EQ(response.content_length(), 2U);
    EXPECT_EQ(std::move(response).bytes(), "ab");
}

TEST(ResponseTest, TextDecodesLossily) {
    auto response = make_response({}, {"ok \xFF", "\xC3\xA9"});
    EXPECT_EQ(std::move(response).text(), "ok \xEF\xBF\xBD\xC3\xA9");
}

TEST(ResponseTest, InputStreamHandsOverRawBody) {
    auto response = make_response({{"Content-Length", "6"}}, {"abc", "def"});
    auto stream = std::move(response).input_stream();

    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->blocking_read(100), "abc");
    EXPECT_EQ(stream->blocking_read(100), "def");
    EXPECT_FALSE(stream->blocking_read(100).has_value());
}

TEST(ResponseTest, BodyCanOnlyBeMaterializedOnce) {
    auto response = make_response({}, {"abc"});
    EXPECT_EQ(std::move(response).bytes(), "abc");
    EXPECT_THROW((void)std::move(response).text(), std::logic_error);  // NOLINT(bugprone-use-after-move)
}

TEST(ResponseTest, JsonDecodesKitsuAnime) {
    auto response = make_response({}, {R"({"data":{"id":"1","type":"anime","attributes":{"canonicalTitle":"X"}}})"});

    const auto decoded = std::move(response).json<kitsu::AnimeApiResponse>();
    const auto series = decoded.data_.to_series();

    EXPECT_EQ(series.id_, "1");
    EXPECT_EQ(series.title_, "X");
    ASSERT_TRUE(series.type_.has_value());
    EXPECT_EQ(*series.type_, "anime");
    EXPECT_FALSE(series.synopsis_.has_value());
    EXPECT_FALSE(series.poster_resource_.has_value());
}

TEST(ResponseTest, JsonRejectsMalformedBody) {
    auto response = make_response({}, {R"({"data": {"id": )"});

    try {
        (void)std::move(response).json<kitsu::AnimeApiResponse>();
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind_, ClientErrorKind::SERIALIZATION_FAILURE);
    }
}

TEST(ResponseTest, JsonRejectsSchemaMismatch) {
    auto response = make_response({}, {R"({"data":{"id":"1","type":"anime","attributes":{"synopsis":"no title"}}})"});
    EXPECT_THROW((void)std::move(response).json<kitsu::AnimeApiResponse>(), ClientError);
}

TEST(ResponseTest, JsonRejectsEmptyBody) {
    auto response = make_response({{"Content-Length", "0"}}, {});
    EXPECT_THROW((void)std::move(response).json<kitsu::AnimeApiResponse>(), ClientError);
}

TEST(ResponseTest, JsonRejectsTrailingContent) {
    auto response = make_response({}, {R"({"data":{"id":"1","type":"anime","attributes":{"canonicalTitle":"X"}}}{"x":1})"});

    try {
        (void)std::move(response).json<kitsu::AnimeApiResponse>();
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.kind_, ClientErrorKind::SERIALIZATION_FAILURE);
    }
}

TEST(ResponseTest, JsonRejectsMalformedValueItNeverReads) {
    auto response = make_response({}, {R"({"data":{"id":"1","type":"anime","attributes":{"canonicalTitle":"X"}},"meta":{"count":01}})"});
    EXPECT_THROW((void)std::move(response).json<kitsu::AnimeApiResponse>(), ClientError);
}
