#include <gtest/gtest.h>
#include "../../src/loadgen/response_parser.h"

using namespace Occbench;

TEST(ResponseParserTest, ParsesVersionAndStatus) {
    auto parsed = ParseRefreshResponse(R"({"id":"x","version":12,"status":"completed"})", true);
    ASSERT_TRUE(parsed.ok()) << parsed.status();
    EXPECT_EQ(parsed->version, 12);
    ASSERT_TRUE(parsed->status.has_value());
    EXPECT_EQ(*parsed->status, ResourceStatus::kCompleted);
}

TEST(ResponseParserTest, StatusOptionalForFieldVariant) {
    auto parsed = ParseRefreshResponse(R"({"version":3,"title":"t"})", false);
    ASSERT_TRUE(parsed.ok());
    EXPECT_EQ(parsed->version, 3);
    EXPECT_FALSE(parsed->status.has_value());
}

TEST(ResponseParserTest, RejectsBadBodies) {
    EXPECT_FALSE(ParseRefreshResponse("not json", false).ok());
    EXPECT_FALSE(ParseRefreshResponse("[1,2]", false).ok());
    EXPECT_FALSE(ParseRefreshResponse(R"({"status":"pending"})", false).ok());
    EXPECT_FALSE(ParseRefreshResponse(R"({"version":"3"})", false).ok());
    EXPECT_FALSE(ParseRefreshResponse(R"({"version":0})", false).ok());
    EXPECT_FALSE(ParseRefreshResponse(R"({"version":2})", true).ok());
    EXPECT_FALSE(ParseRefreshResponse(R"({"version":2,"status":"archived"})", true).ok());
    EXPECT_EQ(ParseRefreshResponse("", false).status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(ResponseParserTest, CreatedId) {
    EXPECT_EQ(*ParseCreatedId(R"({"id":"abc-123","title":"t"})"), "abc-123");
    EXPECT_EQ(*ParseCreatedId(R"({"id":42})"), "42");
    EXPECT_FALSE(ParseCreatedId(R"({"title":"t"})").ok());
    EXPECT_FALSE(ParseCreatedId(R"({"id":[1]})").ok());
    EXPECT_FALSE(ParseCreatedId("oops").ok());
}
