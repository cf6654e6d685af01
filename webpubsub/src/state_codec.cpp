/*
 * 설명: OpenSSL base64 블록 인코더로 연결 상태 헤더 값을 만들고 해석한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/state_codec_test.cpp
 */
#include "webpubsub/state_codec.hpp"

#include <stdexcept>
#include <vector>

#include <openssl/evp.h>

namespace webpubsub {

namespace {
std::string Base64Encode(const std::string& data) {
  if (data.empty()) {
    return {};
  }
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int written = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written));
}

std::string Base64Decode(std::string_view encoded) {
  if (encoded.size() % 4 != 0) {
    throw std::invalid_argument("base64 길이가 올바르지 않습니다");
  }
  // '='는 마지막 두 자리에만 올 수 있고, 끝에서 두 번째가 '='이면 마지막도 '='여야 한다.
  auto first_pad = encoded.find('=');
  if (first_pad != std::string_view::npos &&
      (first_pad + 2 < encoded.size() || (first_pad + 2 == encoded.size() && encoded.back() != '='))) {
    throw std::invalid_argument("base64 패딩 위치가 올바르지 않습니다");
  }
  std::vector<unsigned char> out(3 * (encoded.size() / 4) + 1);
  int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                static_cast<int>(encoded.size()));
  if (written < 0) {
    throw std::invalid_argument("base64 문자열이 올바르지 않습니다");
  }
  // EVP_DecodeBlock은 패딩 자리까지 0으로 채워 길이에 포함한다.
  std::size_t padding = 0;
  if (!encoded.empty() && encoded.back() == '=') {
    ++padding;
    if (encoded.size() >= 2 && encoded[encoded.size() - 2] == '=') {
      ++padding;
    }
  }
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(written) - padding);
}
}  // namespace

std::string EncodeConnectionStates(const StateMap& states) {
  nlohmann::json json_states = nlohmann::json::object();
  for (const auto& entry : states) {
    json_states[entry.first] = entry.second;
  }
  return Base64Encode(json_states.dump());
}

StateMap DecodeConnectionStates(std::string_view encoded) {
  if (encoded.empty()) {
    return {};
  }
  auto decoded = Base64Decode(encoded);
  auto parsed = nlohmann::json::parse(decoded, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    throw std::invalid_argument("연결 상태가 JSON 객체가 아닙니다");
  }
  return parsed.get<StateMap>();
}

}  // namespace webpubsub
