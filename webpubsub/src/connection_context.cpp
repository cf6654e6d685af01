/*
 * 설명: 연결 상태 맵의 병합을 잠금 하에서 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/state_merger_test.cpp
 */
#include "webpubsub/connection_context.hpp"

#include <utility>

namespace webpubsub {

ConnectionContext::ConnectionContext(StateMap states) : states_(std::move(states)) {}

StateMap ConnectionContext::UpdateStates(const StateMap& update) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& entry : update) {
    states_[entry.first] = entry.second;
  }
  return states_;
}

StateMap ConnectionContext::States() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return states_;
}

}  // namespace webpubsub
