#include <string>
#include <utility>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "webpubsub/state_codec.hpp"
#include "webpubsub/state_merger.hpp"

namespace {

webpubsub::ConnectionContext MakeContext(webpubsub::StateMap states) {
  return webpubsub::ConnectionContext(std::move(states));
}

}  // namespace

TEST(StateMergerTest, ExtractsObjectStates) {
  auto doc = nlohmann::json::parse(R"({"states":{"room":"a","count":2}})");
  auto update = webpubsub::ExtractStateUpdate(doc);
  ASSERT_EQ(update.size(), 2u);
  EXPECT_EQ(update["room"], "a");
  EXPECT_EQ(update["count"], 2);
}

TEST(StateMergerTest, NonObjectStatesYieldEmptyUpdate) {
  for (const char* text : {R"({"states":null})", R"({"states":[1,2]})", R"({"states":"x"})", R"({"states":3})",
                           R"({"data":"x"})", R"([{"states":{"a":1}}])", "42"}) {
    EXPECT_TRUE(webpubsub::ExtractStateUpdate(nlohmann::json::parse(text)).empty()) << text;
  }
}

TEST(StateMergerTest, MergeNewValueWinsAndReturnsFullMap) {
  auto context = MakeContext({{"a", 1}, {"room", "x"}});
  auto merged = webpubsub::MergeStates(context, {{"room", "a"}, {"b", true}});
  webpubsub::StateMap expected{{"a", 1}, {"b", true}, {"room", "a"}};
  EXPECT_EQ(merged, expected);
  EXPECT_EQ(context.States(), expected);
}

TEST(StateMergerTest, EmptyUpdateLeavesStateUnchanged) {
  auto context = MakeContext({{"room", "x"}});
  auto merged = webpubsub::MergeStates(context, {});
  EXPECT_EQ(merged.size(), 1u);
  EXPECT_EQ(context.States().at("room"), "x");
}

TEST(StateMergerTest, HeaderOnlyAttachedForNonEmptyState) {
  webpubsub::HttpResponse res;
  webpubsub::AttachStateHeader(res, {});
  EXPECT_TRUE(res.find("ce-connectionState") == res.end());

  webpubsub::AttachStateHeader(res, {{"room", "a"}});
  ASSERT_TRUE(res.find("ce-connectionState") != res.end());
  auto decoded = webpubsub::DecodeConnectionStates(std::string(res["ce-connectionState"]));
  EXPECT_EQ(decoded.at("room"), "a");
}
