/*
 * 설명: 연결 메타데이터를 정의하고, 요청 하나 동안 연결 상태 맵을 보관하고 병합한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/state_merger_test.cpp
 */
#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "webpubsub/event_classifier.hpp"

namespace webpubsub {

using StateMap = std::map<std::string, nlohmann::json>;

struct ConnectionInfo {
  std::string hub;
  std::string connection_id;
  std::optional<std::string> user_id;
  std::string event_name;
  EventType event_type{EventType::kUser};
};

class ConnectionContext {
 public:
  explicit ConnectionContext(StateMap states = {});

  // 충돌하는 키는 새 값이 이기며, 병합된 전체 맵을 돌려준다.
  StateMap UpdateStates(const StateMap& update);
  StateMap States() const;

 private:
  StateMap states_;
  mutable std::mutex mutex_;
};

}  // namespace webpubsub
