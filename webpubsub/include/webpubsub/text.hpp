/*
 * 설명: 헤더/환경설정 값 처리에 쓰는 문자열 도우미(소문자화, 공백 제거, 쉼표 목록 분리)를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/text_test.cpp
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace webpubsub {

std::string ToLower(std::string_view value);
std::string Trim(std::string_view value);

// 쉼표로 나눈 뒤 각 항목의 공백을 제거하고 빈 항목은 버린다.
std::vector<std::string> SplitList(std::string_view value);

}  // namespace webpubsub
