/*
 * 설명: 애플리케이션 핸들러가 돌려주는 응답 형태(오류/연결/사용자/원시 JSON)와 JSON 스키마를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/response_builder_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <boost/beast/http/status.hpp>
#include <nlohmann/json.hpp>

#include "webpubsub/connection_context.hpp"
#include "webpubsub/data_type.hpp"

namespace webpubsub {

enum class ErrorCode { kUserError = 0, kUnauthorized = 1, kServerError = 2 };

struct ErrorResponse {
  ErrorCode code{ErrorCode::kServerError};
  std::string message;
};

struct ConnectResponse {
  StateMap states;
  std::optional<std::string> user_id;
  std::vector<std::string> groups;
  std::vector<std::string> roles;
  std::optional<std::string> subprotocol;
};

struct UserResponse {
  std::string data;
  DataType data_type{DataType::kText};
  StateMap states;
};

// 핸들러가 타입 없이 돌려준 JSON 문자열.
struct RawJsonResponse {
  std::string text;
};

using HandlerOutput = std::variant<ErrorResponse, ConnectResponse, UserResponse, RawJsonResponse>;

// UserError=400, Unauthorized=401, 나머지는 모두 500.
boost::beast::http::status StatusCodeFor(ErrorCode code);

ErrorCode ParseErrorCode(const nlohmann::json& value);
DataType ParseDataTypeName(const nlohmann::json& value);

ErrorResponse ErrorResponseFromJson(const nlohmann::json& j);
UserResponse UserResponseFromJson(const nlohmann::json& j);
nlohmann::json ToJson(const ConnectResponse& response);

}  // namespace webpubsub
