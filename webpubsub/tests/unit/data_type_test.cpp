#include <string>

#include <gtest/gtest.h>

#include "webpubsub/data_type.hpp"

TEST(DataTypeTest, ContentTypeRoundTripsForEveryKind) {
  for (auto kind : {webpubsub::DataType::kBinary, webpubsub::DataType::kText, webpubsub::DataType::kJson}) {
    EXPECT_EQ(webpubsub::ParseDataType(webpubsub::ContentTypeFor(kind)), kind);
  }
}

TEST(DataTypeTest, ContentTypeStrings) {
  EXPECT_EQ(webpubsub::ContentTypeFor(webpubsub::DataType::kText), "text/plain");
  EXPECT_EQ(webpubsub::ContentTypeFor(webpubsub::DataType::kJson), "application/json");
  EXPECT_EQ(webpubsub::ContentTypeFor(webpubsub::DataType::kBinary), "application/octet-stream");
  EXPECT_EQ(webpubsub::ContentTypeFor(static_cast<webpubsub::DataType>(42)), "application/octet-stream");
}

TEST(DataTypeTest, ParseIsCaseInsensitive) {
  EXPECT_EQ(webpubsub::ParseDataType("Application/JSON"), webpubsub::DataType::kJson);
  EXPECT_EQ(webpubsub::ParseDataType("TEXT/PLAIN"), webpubsub::DataType::kText);
}

TEST(DataTypeTest, ParseRejectsUnknownMediaType) {
  EXPECT_THROW(webpubsub::ParseDataType("image/png"), webpubsub::UnsupportedMediaTypeError);
  EXPECT_THROW(webpubsub::ParseDataType(""), webpubsub::UnsupportedMediaTypeError);
  // 파라미터가 붙은 값은 정확히 일치하지 않으므로 거부된다.
  EXPECT_THROW(webpubsub::ParseDataType("application/json; charset=utf-8"), webpubsub::UnsupportedMediaTypeError);
}

TEST(DataTypeTest, TryParseFallsBackToBinary) {
  webpubsub::DataType data_type = webpubsub::DataType::kJson;
  EXPECT_FALSE(webpubsub::TryParseDataType("text/html", data_type));
  EXPECT_EQ(data_type, webpubsub::DataType::kBinary);

  data_type = webpubsub::DataType::kText;
  EXPECT_FALSE(webpubsub::TryParseDataType(std::string("\0\xff", 2), data_type));
  EXPECT_EQ(data_type, webpubsub::DataType::kBinary);

  EXPECT_TRUE(webpubsub::TryParseDataType("text/plain", data_type));
  EXPECT_EQ(data_type, webpubsub::DataType::kText);
}
