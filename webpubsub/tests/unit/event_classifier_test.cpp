#include <stdexcept>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "webpubsub/event_classifier.hpp"

namespace {

webpubsub::HttpRequest MakeRequest(boost::beast::http::verb method) {
  webpubsub::HttpRequest req{method, "/api/webpubsub", 11};
  return req;
}

}  // namespace

TEST(EventClassifierTest, SystemPrefixIsCaseInsensitive) {
  EXPECT_EQ(webpubsub::ClassifyEventType("azure.webpubsub.sys.connected"), webpubsub::EventType::kSystem);
  EXPECT_EQ(webpubsub::ClassifyEventType("Azure.WebPubSub.SYS.connect"), webpubsub::EventType::kSystem);
  EXPECT_EQ(webpubsub::ClassifyEventType("azure.webpubsub.user.message"), webpubsub::EventType::kUser);
  EXPECT_EQ(webpubsub::ClassifyEventType("chat.message"), webpubsub::EventType::kUser);
  EXPECT_EQ(webpubsub::ClassifyEventType(""), webpubsub::EventType::kUser);
}

TEST(EventClassifierTest, RequestTypeForSystemEvents) {
  using webpubsub::EventType;
  using webpubsub::RequestType;
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kSystem, "connected"), RequestType::kConnected);
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kSystem, "disconnected"), RequestType::kDisconnected);
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kSystem, "connect"), RequestType::kConnect);
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kSystem, "CONNECT"), RequestType::kConnect);
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kSystem, "foo"), RequestType::kIgnored);
}

TEST(EventClassifierTest, UserEventsAlwaysMapToUser) {
  using webpubsub::EventType;
  using webpubsub::RequestType;
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kUser, "anything"), RequestType::kUser);
  EXPECT_EQ(webpubsub::ClassifyRequest(EventType::kUser, "connect"), RequestType::kUser);
}

TEST(EventClassifierTest, ValidationRequestCollectsOriginsInOrder) {
  for (auto method : {boost::beast::http::verb::options, boost::beast::http::verb::get}) {
    auto req = MakeRequest(method);
    req.insert("WebHook-Request-Origin", "a.webpubsub.azure.com");
    req.insert("WebHook-Request-Origin", "b.webpubsub.azure.com");
    std::vector<std::string> hosts;
    ASSERT_TRUE(webpubsub::IsValidationRequest(req, hosts));
    ASSERT_EQ(hosts.size(), 2u);
    EXPECT_EQ(hosts[0], "a.webpubsub.azure.com");
    EXPECT_EQ(hosts[1], "b.webpubsub.azure.com");
  }
}

TEST(EventClassifierTest, PostIsNotValidationRequest) {
  auto req = MakeRequest(boost::beast::http::verb::post);
  req.set("WebHook-Request-Origin", "a.webpubsub.azure.com");
  std::vector<std::string> hosts{"stale"};
  EXPECT_FALSE(webpubsub::IsValidationRequest(req, hosts));
  EXPECT_TRUE(hosts.empty());
}

TEST(EventClassifierTest, ValidationRequestWithoutOriginThrows) {
  auto req = MakeRequest(boost::beast::http::verb::options);
  std::vector<std::string> hosts;
  EXPECT_THROW(webpubsub::IsValidationRequest(req, hosts), std::invalid_argument);
}
