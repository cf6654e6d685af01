/*
 * 설명: 핸들러 응답 레코드의 JSON 변환과 오류 코드 매핑을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/response_builder_test.cpp
 */
#include "webpubsub/event_response.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "webpubsub/state_merger.hpp"
#include "webpubsub/text.hpp"

namespace webpubsub {

boost::beast::http::status StatusCodeFor(ErrorCode code) {
  using boost::beast::http::status;
  switch (code) {
    case ErrorCode::kUserError:
      return status::bad_request;
    case ErrorCode::kUnauthorized:
      return status::unauthorized;
    case ErrorCode::kServerError:
      return status::internal_server_error;
    default:
      return status::internal_server_error;
  }
}

ErrorCode ParseErrorCode(const nlohmann::json& value) {
  // 0..2 범위를 벗어난 정수는 int로 좁히지 않고 서버 오류로 본다.
  if (value.is_number_unsigned()) {
    auto code = value.get<std::uint64_t>();
    return code > 2 ? ErrorCode::kServerError : static_cast<ErrorCode>(code);
  }
  if (value.is_number_integer()) {
    auto code = value.get<std::int64_t>();
    return (code < 0 || code > 2) ? ErrorCode::kServerError : static_cast<ErrorCode>(code);
  }
  if (!value.is_string()) {
    throw std::invalid_argument("code 필드가 문자열이나 정수가 아닙니다");
  }
  auto name = ToLower(value.get<std::string>());
  if (name == "usererror") {
    return ErrorCode::kUserError;
  }
  if (name == "unauthorized") {
    return ErrorCode::kUnauthorized;
  }
  if (name == "servererror") {
    return ErrorCode::kServerError;
  }
  throw std::invalid_argument("알 수 없는 오류 코드입니다: " + value.get<std::string>());
}

DataType ParseDataTypeName(const nlohmann::json& value) {
  if (value.is_number_integer()) {
    auto code = value.is_number_unsigned() ? static_cast<std::int64_t>(std::min<std::uint64_t>(
                                                 value.get<std::uint64_t>(), 3))
                                           : value.get<std::int64_t>();
    switch (code) {
      case 0:
        return DataType::kBinary;
      case 1:
        return DataType::kJson;
      case 2:
        return DataType::kText;
      default:
        throw std::invalid_argument("알 수 없는 dataType 값입니다");
    }
  }
  if (!value.is_string()) {
    throw std::invalid_argument("dataType 필드가 문자열이나 정수가 아닙니다");
  }
  auto name = ToLower(value.get<std::string>());
  if (name == "binary") {
    return DataType::kBinary;
  }
  if (name == "json") {
    return DataType::kJson;
  }
  if (name == "text") {
    return DataType::kText;
  }
  throw std::invalid_argument("알 수 없는 dataType 값입니다: " + value.get<std::string>());
}

ErrorResponse ErrorResponseFromJson(const nlohmann::json& j) {
  ErrorResponse error;
  error.code = ParseErrorCode(j.at("code"));
  if (j.contains("errorMessage") && !j["errorMessage"].is_null()) {
    error.message = j["errorMessage"].get<std::string>();
  }
  return error;
}

UserResponse UserResponseFromJson(const nlohmann::json& j) {
  UserResponse response;
  if (j.contains("data") && !j["data"].is_null()) {
    const auto& data = j["data"];
    response.data = data.is_string() ? data.get<std::string>() : data.dump();
  }
  if (j.contains("dataType") && !j["dataType"].is_null()) {
    response.data_type = ParseDataTypeName(j["dataType"]);
  }
  response.states = ExtractStateUpdate(j);
  return response;
}

nlohmann::json ToJson(const ConnectResponse& response) {
  nlohmann::json j = nlohmann::json::object();
  if (response.user_id) {
    j["userId"] = *response.user_id;
  }
  if (!response.groups.empty()) {
    j["groups"] = response.groups;
  }
  if (!response.roles.empty()) {
    j["roles"] = response.roles;
  }
  if (response.subprotocol) {
    j["subprotocol"] = *response.subprotocol;
  }
  if (!response.states.empty()) {
    j["states"] = response.states;
  }
  return j;
}

}  // namespace webpubsub
