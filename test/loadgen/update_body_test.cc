#include <gtest/gtest.h>
#include "../../src/loadgen/update_body.h"

#include <nlohmann/json.hpp>

using namespace Occbench;
using json = nlohmann::json;

class UpdateBodyTest : public ::testing::Test {
protected:
    std::mt19937 rng_{1234};
};

TEST_F(UpdateBodyTest, EveryBodyCarriesVersion) {
    for (UpdateType type : {UpdateType::kPriority, UpdateType::kStatus, UpdateType::kDescription,
                            UpdateType::kTitle, UpdateType::kFull}) {
        json body = json::parse(BuildFieldUpdateBody(type, 7, 1, rng_));
        EXPECT_EQ(body["version"], 7) << UpdateTypeName(type);
    }
}

TEST_F(UpdateBodyTest, DescriptionMentionsRequestCounter) {
    json body = json::parse(BuildFieldUpdateBody(UpdateType::kDescription, 1, 42, rng_));
    EXPECT_EQ(body["description"], "Updated description via Optional optic - request 42");
    EXPECT_EQ(body.size(), 2u);
}

TEST_F(UpdateBodyTest, PriorityIsFromTheKnownSet) {
    for (int i = 0; i < 50; ++i) {
        json body = json::parse(BuildFieldUpdateBody(UpdateType::kPriority, 1, i, rng_));
        std::string p = body["priority"];
        EXPECT_TRUE(p == "low" || p == "medium" || p == "high" || p == "critical") << p;
    }
}

TEST_F(UpdateBodyTest, FullUpdateHasAllFields) {
    json body = json::parse(BuildFieldUpdateBody(UpdateType::kFull, 3, 1, rng_));
    EXPECT_TRUE(body.contains("title"));
    EXPECT_EQ(body["description"], "Full update via combined optics");
    EXPECT_TRUE(body.contains("priority"));
    EXPECT_TRUE(ParseStatus(body["status"].get<std::string>()).has_value());
    EXPECT_EQ(body["tags"], json::array({"updated", "benchmark"}));
    const std::string title = body["title"];
    EXPECT_NE(title.find("(full update)"), std::string::npos);
}

TEST_F(UpdateBodyTest, TitleUpdateIsMarked) {
    json body = json::parse(BuildFieldUpdateBody(UpdateType::kTitle, 1, 1, rng_));
    const std::string title = body["title"];
    EXPECT_NE(title.find("(updated)"), std::string::npos);
}

TEST_F(UpdateBodyTest, NextStatusFollowsTransitionTable) {
    for (int i = 0; i < 100; ++i) {
        auto next = PickNextStatus(ResourceStatus::kPending, rng_);
        ASSERT_TRUE(next.has_value());
        EXPECT_TRUE(*next == ResourceStatus::kInProgress || *next == ResourceStatus::kCancelled);
    }
    auto reopened = PickNextStatus(ResourceStatus::kCompleted, rng_);
    ASSERT_TRUE(reopened.has_value());
    EXPECT_EQ(*reopened, ResourceStatus::kPending);
    EXPECT_FALSE(PickNextStatus(ResourceStatus::kCancelled, rng_).has_value());
}

TEST_F(UpdateBodyTest, StatusBody) {
    json body = json::parse(BuildStatusUpdateBody(ResourceStatus::kInProgress, 5));
    EXPECT_EQ(body["status"], "in_progress");
    EXPECT_EQ(body["version"], 5);
}

TEST(UpdateTypeListTest, ParsesAndTrims) {
    auto types = ParseUpdateTypeList(" title , priority");
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0], UpdateType::kTitle);
    EXPECT_EQ(types[1], UpdateType::kPriority);
}

TEST(UpdateTypeListTest, UnknownNamesAreDropped) {
    auto types = ParseUpdateTypeList("title,bogus");
    ASSERT_EQ(types.size(), 1u);
    EXPECT_EQ(types[0], UpdateType::kTitle);
}

TEST(UpdateTypeListTest, EmptyFallsBackToAll) {
    EXPECT_EQ(ParseUpdateTypeList("").size(), 5u);
    EXPECT_EQ(ParseUpdateTypeList("nope,,").size(), 5u);
}
