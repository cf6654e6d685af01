/*
 * 설명: 웹훅 요청/응답에서 사용하는 헤더 이름, 이벤트 이름, HTTP 타입 별칭을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <boost/beast/http.hpp>

namespace webpubsub {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

namespace headers {
constexpr const char* kType = "ce-type";
constexpr const char* kEventName = "ce-eventName";
constexpr const char* kConnectionId = "ce-connectionId";
constexpr const char* kUserId = "ce-userId";
constexpr const char* kHub = "ce-hub";
constexpr const char* kConnectionState = "ce-connectionState";
constexpr const char* kSignature = "ce-signature";
constexpr const char* kWebHookRequestOrigin = "WebHook-Request-Origin";
constexpr const char* kWebHookAllowedOrigin = "WebHook-Allowed-Origin";
}  // namespace headers

namespace events {
constexpr const char* kSystemTypePrefix = "azure.webpubsub.sys.";
constexpr const char* kConnect = "connect";
constexpr const char* kConnected = "connected";
constexpr const char* kDisconnected = "disconnected";
}  // namespace events

namespace content_types {
constexpr const char* kPlainText = "text/plain";
constexpr const char* kJson = "application/json";
constexpr const char* kBinary = "application/octet-stream";
}  // namespace content_types

}  // namespace webpubsub
