/*
 * 설명: 웹훅 요청 하나를 검증/분류하고 애플리케이션 핸들러 출력을 서비스 응답으로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/webhook_service_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "webpubsub/config.hpp"
#include "webpubsub/connection_context.hpp"
#include "webpubsub/data_type.hpp"
#include "webpubsub/event_classifier.hpp"
#include "webpubsub/event_response.hpp"
#include "webpubsub/observability.hpp"
#include "webpubsub/protocol.hpp"

namespace webpubsub {

struct WebPubSubEvent {
  RequestType request_type{RequestType::kIgnored};
  ConnectionInfo connection;
  StateMap states;
  DataType data_type{DataType::kBinary};
  std::string data;
};

// nullopt는 "돌려줄 내용 없음"이며 기본 200 응답으로 처리된다.
using EventHandler = std::function<std::optional<HandlerOutput>(const WebPubSubEvent&)>;

class WebhookService {
 public:
  WebhookService(const AppConfig& config, EventHandler handler, std::shared_ptr<Observability> observability);

  // 웹훅 경로 외에는 GET /metrics 만 응답하고 나머지는 404 이다.
  HttpResponse Handle(const HttpRequest& req, const std::string& trace_id);

 private:
  HttpResponse HandleMetrics();
  HttpResponse HandleValidation(const std::vector<std::string>& request_hosts, const std::string& trace_id);
  HttpResponse HandleEvent(const HttpRequest& req, const std::string& trace_id);
  std::optional<std::string> MatchAllowedOrigin(const std::vector<std::string>& request_hosts) const;
  HttpResponse Reject(boost::beast::http::status status, const std::string& message, const std::string& trace_id);

  AppConfig config_;
  EventHandler handler_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace webpubsub
