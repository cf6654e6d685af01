/*
 * 설명: 페이로드 종류(DataType)와 MIME 콘텐츠 타입 간의 양방향 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/data_type_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace webpubsub {

enum class DataType { kBinary, kText, kJson };

class UnsupportedMediaTypeError : public std::invalid_argument {
 public:
  explicit UnsupportedMediaTypeError(const std::string& media_type);
};

// 알 수 없는 값은 서비스 측 기본값과 맞추기 위해 octet-stream으로 보낸다.
std::string ContentTypeFor(DataType data_type);

DataType ParseDataType(std::string_view content_type);
bool TryParseDataType(std::string_view content_type, DataType& data_type);

}  // namespace webpubsub
