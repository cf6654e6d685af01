#include <stdexcept>

#include <gtest/gtest.h>

#include "webpubsub/state_codec.hpp"

TEST(StateCodecTest, EncodesAsBase64Json) {
  webpubsub::StateMap states{{"room", "a"}};
  EXPECT_EQ(webpubsub::EncodeConnectionStates(states), "eyJyb29tIjoiYSJ9");
}

TEST(StateCodecTest, DecodesPaddedValue) {
  auto states = webpubsub::DecodeConnectionStates("eyJjb3VudCI6MSwicm9vbSI6ImEifQ==");
  ASSERT_EQ(states.size(), 2u);
  EXPECT_EQ(states["count"], 1);
  EXPECT_EQ(states["room"], "a");
}

TEST(StateCodecTest, DecodeOfEncodePreservesNestedValues) {
  webpubsub::StateMap states;
  states["profile"] = nlohmann::json{{"name", "kim"}, {"tags", {"x", "y"}}};
  states["flag"] = true;
  EXPECT_EQ(webpubsub::DecodeConnectionStates(webpubsub::EncodeConnectionStates(states)), states);
}

TEST(StateCodecTest, EmptyInputIsEmptyMap) { EXPECT_TRUE(webpubsub::DecodeConnectionStates("").empty()); }

TEST(StateCodecTest, RejectsMalformedInput) {
  EXPECT_THROW(webpubsub::DecodeConnectionStates("abc"), std::invalid_argument);
  EXPECT_THROW(webpubsub::DecodeConnectionStates("****"), std::invalid_argument);
  // "[1,2]"는 JSON이지만 객체가 아니다.
  EXPECT_THROW(webpubsub::DecodeConnectionStates("WzEsMl0="), std::invalid_argument);
}

TEST(StateCodecTest, RejectsMisplacedPadding) {
  EXPECT_THROW(webpubsub::DecodeConnectionStates("A==="), std::invalid_argument);
  EXPECT_THROW(webpubsub::DecodeConnectionStates("===="), std::invalid_argument);
  EXPECT_THROW(webpubsub::DecodeConnectionStates("e30=e30="), std::invalid_argument);
  EXPECT_THROW(webpubsub::DecodeConnectionStates("e3=9"), std::invalid_argument);
}
