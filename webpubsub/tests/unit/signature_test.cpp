#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "webpubsub/signature.hpp"

namespace {
const std::string kExpected = "sha256=9a7a45e0af680231c31873ee9b974300e9c58047441fe676cc41bf04d5d5e1d3";
}  // namespace

TEST(SignatureTest, ComputesHmacSha256Hex) { EXPECT_EQ(webpubsub::ComputeSignature("key1", "conn-1"), kExpected); }

TEST(SignatureTest, AcceptsAnyMatchingEntry) {
  std::vector<std::string> keys{"other", "key1"};
  EXPECT_TRUE(webpubsub::ValidateSignature("conn-1", "sha256=deadbeef, " + kExpected, keys));
}

TEST(SignatureTest, ComparisonIgnoresHexCase) {
  std::string upper = "SHA256=9A7A45E0AF680231C31873EE9B974300E9C58047441FE676CC41BF04D5D5E1D3";
  EXPECT_TRUE(webpubsub::ValidateSignature("conn-1", upper, {"key1"}));
}

TEST(SignatureTest, RejectsWrongOrMissingSignature) {
  EXPECT_FALSE(webpubsub::ValidateSignature("conn-2", kExpected, {"key1"}));
  EXPECT_FALSE(webpubsub::ValidateSignature("conn-1", "", {"key1"}));
}

TEST(SignatureTest, NoKeysSkipsValidation) { EXPECT_TRUE(webpubsub::ValidateSignature("conn-1", "", {})); }
