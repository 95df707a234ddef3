#include "../src/http/transport/fields.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using http::transport::Fields;
using http::transport::HeaderError;
using http::transport::HeaderErrorKind;

TEST(FieldsTest, GetIsCaseInsensitiveAndOrdered) {
    Fields fields;
    fields.append("Accept", "text/html");
    fields.append("X-Other", "1");
    fields.append("accept", "application/json");

    const std::vector<std::string> expected = {"text/html", "application/json"};
    EXPECT_EQ(fields.get("ACCEPT"), expected);
    EXPECT_TRUE(fields.has("x-other"));
    EXPECT_EQ(fields.size(), 3U);
}

TEST(FieldsTest, GetMissingReturnsEmpty) {
    const Fields fields;
    EXPECT_TRUE(fields.get("Location").empty());
    EXPECT_FALSE(fields.has("Location"));
}

TEST(FieldsTest, SetReplacesAllValues) {
    Fields fields;
    fields.append("Content-Length", "1");
    fields.append("content-length", "2");
    fields.set("Content-Length", {"3"});

    const std::vector<std::string> expected = {"3"};
    EXPECT_EQ(fields.get("content-length"), expected);
}

TEST(FieldsTest, ValuesAreRawBytes) {
    Fields fields;
    fields.append("X-Binary", std::string("\xFF\x01", 2));
    EXPECT_EQ(fields.get("x-binary").front(), std::string("\xFF\x01", 2));
}

TEST(FieldsTest, RejectsInvalidName) {
    Fields fields;
    try {
        fields.append("Bad Header", "v");
        FAIL() << "expected HeaderError";
    } catch (const HeaderError& e) {
        EXPECT_EQ(e.kind_, HeaderErrorKind::INVALID_SYNTAX);
    }
    EXPECT_THROW(fields.append("", "v"), HeaderError);
    EXPECT_THROW(fields.append("X-\xC3\xA9", "v"), HeaderError);
    EXPECT_TRUE(fields.empty());
}

TEST(FieldsTest, RejectsInvalidValue) {
    Fields fields;
    EXPECT_THROW(fields.append("X-Injected", "a\r\nHost: evil"), HeaderError);
    EXPECT_THROW(fields.append("X-Null", std::string("a\0b", 3)), HeaderError);
}

TEST(FieldsTest, RejectsForbiddenNames) {
    Fields fields;
    try {
        fields.append("Host", "example.com");
        FAIL() << "expected HeaderError";
    } catch (const HeaderError& e) {
        EXPECT_EQ(e.kind_, HeaderErrorKind::FORBIDDEN);
    }
    EXPECT_THROW(fields.append("transfer-encoding", "chunked"), HeaderError);
}

TEST(FieldsTest, RemoveDropsEveryValue) {
    Fields fields;
    fields.append("A", "1");
    fields.append("B", "2");
    fields.append("a", "3");
    fields.remove("A");

    EXPECT_FALSE(fields.has("a"));
    EXPECT_EQ(fields.size(), 1U);
}
