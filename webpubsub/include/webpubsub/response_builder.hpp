/*
 * 설명: 핸들러 출력과 요청 타입으로 서비스에 돌려줄 HTTP 응답을 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/response_builder_test.cpp
 */
#pragma once

#include <optional>
#include <string>

#include "webpubsub/connection_context.hpp"
#include "webpubsub/data_type.hpp"
#include "webpubsub/event_classifier.hpp"
#include "webpubsub/event_response.hpp"
#include "webpubsub/protocol.hpp"

namespace webpubsub {

struct BuildResult {
  std::optional<HttpResponse> response;
  // response가 없을 때 그 원인. 의도적으로 응답하지 않는 경우에는 비어 있다.
  std::string error;
};

HttpResponse BuildErrorResponse(const ErrorResponse& error);
// 연결 응답 본문은 항상 application/json 이다.
HttpResponse BuildConnectResponse(const std::string& body, const StateMap& merged_states);
HttpResponse BuildUserResponse(const UserResponse& response, const StateMap& merged_states);

// 실패는 예외로 새지 않고 response 없이 error에 담겨 돌아온다.
BuildResult BuildEventResponse(const HandlerOutput& output, RequestType request_type, ConnectionContext& context);

}  // namespace webpubsub
