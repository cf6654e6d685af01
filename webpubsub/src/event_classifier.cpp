/*
 * 설명: 이벤트/요청 분류와 검증 요청 판별을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/event_classifier_test.cpp
 */
#include "webpubsub/event_classifier.hpp"

#include <stdexcept>
#include <string>

#include "webpubsub/text.hpp"

namespace webpubsub {

EventType ClassifyEventType(std::string_view ce_type) {
  const std::string prefix = events::kSystemTypePrefix;
  if (ce_type.size() >= prefix.size() && ToLower(ce_type.substr(0, prefix.size())) == prefix) {
    return EventType::kSystem;
  }
  return EventType::kUser;
}

RequestType ClassifyRequest(EventType event_type, std::string_view event_name) {
  if (event_type == EventType::kUser) {
    return RequestType::kUser;
  }
  auto name = ToLower(event_name);
  if (name == events::kConnect) {
    return RequestType::kConnect;
  }
  if (name == events::kDisconnected) {
    return RequestType::kDisconnected;
  }
  if (name == events::kConnected) {
    return RequestType::kConnected;
  }
  return RequestType::kIgnored;
}

bool IsValidationRequest(const HttpRequest& req, std::vector<std::string>& request_hosts) {
  using boost::beast::http::verb;
  request_hosts.clear();
  if (req.method() != verb::options && req.method() != verb::get) {
    return false;
  }
  auto range = req.equal_range(headers::kWebHookRequestOrigin);
  for (auto it = range.first; it != range.second; ++it) {
    request_hosts.emplace_back(it->value());
  }
  if (request_hosts.empty()) {
    throw std::invalid_argument(std::string("검증 요청에 ") + headers::kWebHookRequestOrigin + " 헤더가 없습니다");
  }
  return true;
}

const char* ToString(RequestType request_type) {
  switch (request_type) {
    case RequestType::kConnect:
      return "connect";
    case RequestType::kConnected:
      return "connected";
    case RequestType::kDisconnected:
      return "disconnected";
    case RequestType::kUser:
      return "user";
    case RequestType::kIgnored:
      return "ignored";
  }
  return "ignored";
}

}  // namespace webpubsub
