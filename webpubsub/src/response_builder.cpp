/*
 * 설명: 오류/연결/사용자 응답을 만들고, 핸들러 출력 형태와 요청 타입에 따라 분기한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/response_builder_test.cpp
 */
#include "webpubsub/response_builder.hpp"

#include <exception>
#include <string>
#include <utility>
#include <variant>

#include "webpubsub/state_merger.hpp"

namespace webpubsub {

namespace {
// connected/disconnected 및 무시된 이벤트에는 서비스가 본문을 기대하지 않는다.
bool ExpectsResponseBody(RequestType request_type) {
  return request_type == RequestType::kConnect || request_type == RequestType::kUser;
}

void SetBody(HttpResponse& res, std::string body, DataType data_type) {
  res.set(boost::beast::http::field::content_type, ContentTypeFor(data_type));
  res.body() = std::move(body);
  res.content_length(res.body().size());
}

class OutputDispatcher {
 public:
  OutputDispatcher(RequestType request_type, ConnectionContext& context)
      : request_type_(request_type), context_(context) {}

  BuildResult operator()(const ErrorResponse& error) const { return {BuildErrorResponse(error), {}}; }

  BuildResult operator()(const ConnectResponse& response) const {
    if (request_type_ != RequestType::kConnect) {
      return Mismatch("connect");
    }
    auto merged = MergeStates(context_, response.states);
    return {BuildConnectResponse(ToJson(response).dump(), merged), {}};
  }

  BuildResult operator()(const UserResponse& response) const {
    if (request_type_ != RequestType::kUser) {
      return Mismatch("user");
    }
    auto merged = MergeStates(context_, response.states);
    return {BuildUserResponse(response, merged), {}};
  }

  BuildResult operator()(const RawJsonResponse& raw) const {
    auto document = nlohmann::json::parse(raw.text, nullptr, false);
    if (document.is_discarded()) {
      return {std::nullopt, "핸들러 출력이 올바른 JSON이 아닙니다"};
    }
    if (!document.is_object()) {
      return {std::nullopt, "핸들러 출력이 JSON 객체가 아닙니다"};
    }
    if (document.contains("code")) {
      return {BuildErrorResponse(ErrorResponseFromJson(document)), {}};
    }
    if (request_type_ == RequestType::kConnect) {
      auto merged = MergeStates(context_, ExtractStateUpdate(document));
      return {BuildConnectResponse(raw.text, merged), {}};
    }
    auto response = UserResponseFromJson(document);
    auto merged = MergeStates(context_, response.states);
    return {BuildUserResponse(response, merged), {}};
  }

 private:
  BuildResult Mismatch(const char* shape) const {
    return {std::nullopt, std::string(shape) + " 응답이 " + ToString(request_type_) + " 요청과 맞지 않습니다"};
  }

  RequestType request_type_;
  ConnectionContext& context_;
};
}  // namespace

HttpResponse BuildErrorResponse(const ErrorResponse& error) {
  HttpResponse res;
  res.result(StatusCodeFor(error.code));
  SetBody(res, error.message, DataType::kText);
  return res;
}

HttpResponse BuildConnectResponse(const std::string& body, const StateMap& merged_states) {
  HttpResponse res;
  res.result(boost::beast::http::status::ok);
  AttachStateHeader(res, merged_states);
  SetBody(res, body, DataType::kJson);
  return res;
}

HttpResponse BuildUserResponse(const UserResponse& response, const StateMap& merged_states) {
  HttpResponse res;
  res.result(boost::beast::http::status::ok);
  AttachStateHeader(res, merged_states);
  SetBody(res, response.data, response.data_type);
  return res;
}

BuildResult BuildEventResponse(const HandlerOutput& output, RequestType request_type, ConnectionContext& context) {
  if (!ExpectsResponseBody(request_type)) {
    return {};
  }
  try {
    return std::visit(OutputDispatcher(request_type, context), output);
  } catch (const std::exception& ex) {
    return {std::nullopt, ex.what()};
  }
}

}  // namespace webpubsub
