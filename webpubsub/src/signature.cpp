/*
 * 설명: 접근 키별 HMAC-SHA256 서명을 계산하고 헤더 값과 상수 시간으로 비교한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/signature_test.cpp
 */
#include "webpubsub/signature.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "webpubsub/text.hpp"

namespace webpubsub {

namespace {
const std::string kSignaturePrefix = "sha256=";

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::vector<std::string> SplitSignatures(const std::string& header) {
  auto values = SplitList(header);
  for (auto& value : values) {
    value = ToLower(value);
  }
  return values;
}
}  // namespace

std::string ComputeSignature(const std::string& access_key, const std::string& connection_id) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha256(), access_key.data(), static_cast<int>(access_key.size()),
           reinterpret_cast<const unsigned char*>(connection_id.data()), connection_id.size(), digest,
           &digest_len) == nullptr) {
    throw std::runtime_error("HMAC 계산에 실패했습니다");
  }
  return kSignaturePrefix + BytesToHex(digest, digest_len);
}

bool ValidateSignature(const std::string& connection_id, const std::string& signature_header,
                       const std::vector<std::string>& access_keys) {
  if (access_keys.empty()) {
    return true;
  }
  auto provided = SplitSignatures(signature_header);
  for (const auto& key : access_keys) {
    auto expected = ComputeSignature(key, connection_id);
    for (const auto& candidate : provided) {
      if (candidate.size() == expected.size() &&
          CRYPTO_memcmp(candidate.data(), expected.data(), expected.size()) == 0) {
        return true;
      }
    }
  }
  return false;
}

}  // namespace webpubsub
