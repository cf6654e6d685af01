/*
 * 설명: 검증 핸드셰이크, CloudEvents 헤더 해석, 서명 확인, 핸들러 호출과 응답 변환을 순서대로 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/webhook_service_test.cpp
 */
#include "webpubsub/webhook_service.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "webpubsub/response_builder.hpp"
#include "webpubsub/signature.hpp"
#include "webpubsub/state_codec.hpp"
#include "webpubsub/text.hpp"

namespace webpubsub {

namespace {
std::optional<std::string> HeaderValue(const HttpRequest& req, const char* name) {
  auto it = req.find(name);
  if (it == req.end()) {
    return std::nullopt;
  }
  return std::string(it->value());
}

std::string PathOf(const HttpRequest& req) {
  std::string target = std::string(req.target());
  auto qpos = target.find('?');
  return qpos == std::string::npos ? target : target.substr(0, qpos);
}

// "application/json; charset=utf-8" 에서 미디어 타입만 떼어 낸다.
std::string MediaTypeOf(const HttpRequest& req) {
  auto value = HeaderValue(req, "Content-Type").value_or("");
  return Trim(value.substr(0, value.find(';')));
}

HttpResponse EmptyOk() {
  HttpResponse res;
  res.result(boost::beast::http::status::ok);
  res.content_length(0);
  return res;
}
}  // namespace

WebhookService::WebhookService(const AppConfig& config, EventHandler handler,
                               std::shared_ptr<Observability> observability)
    : config_(config), handler_(std::move(handler)), observability_(std::move(observability)) {}

HttpResponse WebhookService::Handle(const HttpRequest& req, const std::string& trace_id) {
  HttpResponse res;
  auto path = PathOf(req);
  if (path != config_.webhook_path) {
    if (req.method() == boost::beast::http::verb::get && path == "/metrics") {
      res = HandleMetrics();
    } else {
      res = Reject(boost::beast::http::status::not_found, "지원되지 않는 경로입니다", trace_id);
    }
  } else {
    std::vector<std::string> request_hosts;
    bool is_validation = false;
    try {
      is_validation = IsValidationRequest(req, request_hosts);
    } catch (const std::invalid_argument& ex) {
      is_validation = true;
      res = Reject(boost::beast::http::status::bad_request, ex.what(), trace_id);
    }
    if (is_validation && !request_hosts.empty()) {
      res = HandleValidation(request_hosts, trace_id);
    } else if (!is_validation) {
      res = HandleEvent(req, trace_id);
    }
  }
  res.version(req.version());
  res.set(boost::beast::http::field::server, "webpubsub-webhook");
  return res;
}

HttpResponse WebhookService::HandleMetrics() {
  MetricsSnapshot snapshot;
  if (observability_) {
    snapshot = observability_->Snapshot();
  }
  nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                      {"invalidResponses", snapshot.invalid_responses},
                      {"ignoredEvents", snapshot.ignored_events}};
  HttpResponse res;
  res.result(boost::beast::http::status::ok);
  res.set(boost::beast::http::field::content_type, ContentTypeFor(DataType::kJson));
  res.body() = data.dump();
  res.content_length(res.body().size());
  return res;
}

HttpResponse WebhookService::HandleValidation(const std::vector<std::string>& request_hosts,
                                              const std::string& trace_id) {
  auto allowed = MatchAllowedOrigin(request_hosts);
  if (!allowed) {
    return Reject(boost::beast::http::status::bad_request, "허용되지 않은 WebHook-Request-Origin 입니다", trace_id);
  }
  auto res = EmptyOk();
  res.set(headers::kWebHookAllowedOrigin, *allowed);
  return res;
}

std::optional<std::string> WebhookService::MatchAllowedOrigin(const std::vector<std::string>& request_hosts) const {
  for (const auto& origin : config_.allowed_origins) {
    if (origin == "*") {
      return std::string("*");
    }
  }
  for (const auto& host : request_hosts) {
    auto lowered = ToLower(host);
    for (const auto& origin : config_.allowed_origins) {
      if (ToLower(origin) == lowered) {
        return host;
      }
    }
  }
  return std::nullopt;
}

HttpResponse WebhookService::HandleEvent(const HttpRequest& req, const std::string& trace_id) {
  using boost::beast::http::status;
  if (req.method() != boost::beast::http::verb::post) {
    return Reject(status::method_not_allowed, "POST 요청만 지원합니다", trace_id);
  }

  auto ce_type = HeaderValue(req, headers::kType);
  auto event_name = HeaderValue(req, headers::kEventName);
  auto connection_id = HeaderValue(req, headers::kConnectionId);
  if (!ce_type || !event_name || !connection_id) {
    return Reject(status::bad_request, "필수 CloudEvents 헤더가 없습니다", trace_id);
  }

  ConnectionInfo info;
  info.hub = HeaderValue(req, headers::kHub).value_or("");
  info.connection_id = *connection_id;
  info.user_id = HeaderValue(req, headers::kUserId);
  info.event_name = *event_name;
  info.event_type = ClassifyEventType(*ce_type);

  if (!config_.hub.empty() && ToLower(info.hub) != ToLower(config_.hub)) {
    return Reject(status::bad_request, "허브가 일치하지 않습니다: " + info.hub, trace_id);
  }

  auto signature = HeaderValue(req, headers::kSignature).value_or("");
  if (!ValidateSignature(info.connection_id, signature, config_.access_keys)) {
    return Reject(status::unauthorized, "서명이 올바르지 않습니다", trace_id);
  }

  StateMap states;
  try {
    states = DecodeConnectionStates(HeaderValue(req, headers::kConnectionState).value_or(""));
  } catch (const std::exception& ex) {
    return Reject(status::bad_request, std::string("연결 상태 헤더가 올바르지 않습니다: ") + ex.what(), trace_id);
  }

  auto request_type = ClassifyRequest(info.event_type, info.event_name);
  if (request_type == RequestType::kIgnored) {
    if (observability_) {
      observability_->IncrementIgnoredEvent();
      observability_->Log(LogContext{trace_id, "system_event_ignored", LogLevel::kWarn, 0, info.connection_id,
                                     info.user_id, "알 수 없는 시스템 이벤트: " + info.event_name});
    }
    return EmptyOk();
  }

  WebPubSubEvent event;
  event.request_type = request_type;
  event.connection = info;
  event.states = states;
  TryParseDataType(MediaTypeOf(req), event.data_type);
  event.data = req.body();

  std::optional<HandlerOutput> output;
  try {
    if (handler_) {
      output = handler_(event);
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogContext{trace_id, "handler_failed", LogLevel::kError, 0, info.connection_id,
                                     info.user_id, std::string(ex.what())});
    }
    return BuildErrorResponse(ErrorResponse{ErrorCode::kServerError, "이벤트 처리 중 오류가 발생했습니다"});
  }
  if (!output) {
    return EmptyOk();
  }

  ConnectionContext context(states);
  auto result = BuildEventResponse(*output, request_type, context);
  if (!result.error.empty() && observability_) {
    observability_->IncrementInvalidResponse();
    observability_->Log(LogContext{trace_id, "invalid_handler_response", LogLevel::kWarn, 0, info.connection_id,
                                   info.user_id, result.error});
  }
  if (!result.response) {
    return EmptyOk();
  }
  return std::move(*result.response);
}

HttpResponse WebhookService::Reject(boost::beast::http::status status, const std::string& message,
                                    const std::string& trace_id) {
  if (observability_) {
    observability_->Log(LogContext{trace_id, "webhook_rejected", LogLevel::kWarn, 0, std::nullopt, std::nullopt,
                                   message});
  }
  HttpResponse res;
  res.result(status);
  res.set(boost::beast::http::field::content_type, ContentTypeFor(DataType::kText));
  res.body() = message;
  res.content_length(res.body().size());
  return res;
}

}  // namespace webpubsub
