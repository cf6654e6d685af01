/*
 * 설명: 웹훅 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace webpubsub {

struct AppConfig {
  unsigned short port{8080};
  std::string webhook_path{"/api/webpubsub"};
  std::string hub;
  std::vector<std::string> allowed_origins{"*"};
  std::vector<std::string> access_keys;
  std::string log_level{"info"};
  std::size_t request_timeout_seconds{30};
};

AppConfig LoadConfigFromEnv();

}  // namespace webpubsub
