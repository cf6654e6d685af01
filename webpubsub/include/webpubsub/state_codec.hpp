/*
 * 설명: 연결 상태 맵을 헤더에 실을 수 있는 base64(JSON) 문자열로 인코딩/디코딩한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/state_codec_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include "webpubsub/connection_context.hpp"

namespace webpubsub {

std::string EncodeConnectionStates(const StateMap& states);

// 빈 입력은 빈 맵이다. 잘못된 base64나 객체가 아닌 JSON이면 std::invalid_argument를 던진다.
StateMap DecodeConnectionStates(std::string_view encoded);

}  // namespace webpubsub
