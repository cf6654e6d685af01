/*
 * 설명: DataType과 콘텐츠 타입 문자열을 상호 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/data_type_test.cpp
 */
#include "webpubsub/data_type.hpp"

#include "webpubsub/protocol.hpp"
#include "webpubsub/text.hpp"

namespace webpubsub {

UnsupportedMediaTypeError::UnsupportedMediaTypeError(const std::string& media_type)
    : std::invalid_argument("지원되지 않는 데이터 타입입니다: " + media_type) {}

std::string ContentTypeFor(DataType data_type) {
  switch (data_type) {
    case DataType::kText:
      return content_types::kPlainText;
    case DataType::kJson:
      return content_types::kJson;
    default:
      return content_types::kBinary;
  }
}

DataType ParseDataType(std::string_view content_type) {
  auto lowered = ToLower(content_type);
  if (lowered == content_types::kBinary) {
    return DataType::kBinary;
  }
  if (lowered == content_types::kJson) {
    return DataType::kJson;
  }
  if (lowered == content_types::kPlainText) {
    return DataType::kText;
  }
  throw UnsupportedMediaTypeError(std::string(content_type));
}

bool TryParseDataType(std::string_view content_type, DataType& data_type) {
  try {
    data_type = ParseDataType(content_type);
    return true;
  } catch (const UnsupportedMediaTypeError&) {
    data_type = DataType::kBinary;
    return false;
  }
}

}  // namespace webpubsub
