/*
 * 설명: ce-signature 헤더를 접근 키 기반 HMAC-SHA256으로 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/signature_test.cpp
 */
#pragma once

#include <string>
#include <vector>

namespace webpubsub {

std::string ComputeSignature(const std::string& access_key, const std::string& connection_id);

// 키 목록이 비어 있으면 검증을 생략하고 true를 돌려준다.
bool ValidateSignature(const std::string& connection_id, const std::string& signature_header,
                       const std::vector<std::string>& access_keys);

}  // namespace webpubsub
