/*
 * 설명: 핸들러 페이로드에서 상태 갱신을 추출해 연결 상태에 병합하고 응답 헤더로 붙인다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/state_merger_test.cpp
 */
#pragma once

#include <nlohmann/json.hpp>

#include "webpubsub/connection_context.hpp"
#include "webpubsub/protocol.hpp"

namespace webpubsub {

// "states"가 JSON 객체일 때만 내용을 돌려준다. null/배열/스칼라/누락은 빈 맵이며 상태를 지우지 않는다.
StateMap ExtractStateUpdate(const nlohmann::json& document);

StateMap MergeStates(ConnectionContext& context, const StateMap& update);

// 병합 결과가 비어 있으면 헤더를 생략한다.
void AttachStateHeader(HttpResponse& res, const StateMap& merged);

}  // namespace webpubsub
