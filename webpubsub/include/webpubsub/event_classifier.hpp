/*
 * 설명: CloudEvents 헤더로 이벤트 종류와 요청 타입을 분류하고 검증(프리플라이트) 요청을 판별한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/event_classifier_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "webpubsub/protocol.hpp"

namespace webpubsub {

enum class EventType { kSystem, kUser };

enum class RequestType { kConnect, kConnected, kDisconnected, kUser, kIgnored };

EventType ClassifyEventType(std::string_view ce_type);

// 알 수 없는 시스템 이벤트는 오류가 아니라 kIgnored로 떨어진다.
RequestType ClassifyRequest(EventType event_type, std::string_view event_name);

// OPTIONS/GET 요청이면 WebHook-Request-Origin 값을 헤더 순서대로 채운다.
// 검증 요청에 해당 헤더가 없으면 std::invalid_argument를 던진다.
bool IsValidationRequest(const HttpRequest& req, std::vector<std::string>& request_hosts);

const char* ToString(RequestType request_type);

}  // namespace webpubsub
