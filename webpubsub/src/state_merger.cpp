/*
 * 설명: 상태 갱신 추출/병합/헤더 부착을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/unit/state_merger_test.cpp
 */
#include "webpubsub/state_merger.hpp"

#include "webpubsub/state_codec.hpp"

namespace webpubsub {

StateMap ExtractStateUpdate(const nlohmann::json& document) {
  if (!document.is_object()) {
    return {};
  }
  auto it = document.find("states");
  if (it == document.end() || !it->is_object()) {
    return {};
  }
  return it->get<StateMap>();
}

StateMap MergeStates(ConnectionContext& context, const StateMap& update) { return context.UpdateStates(update); }

void AttachStateHeader(HttpResponse& res, const StateMap& merged) {
  if (merged.empty()) {
    return;
  }
  res.set(headers::kConnectionState, EncodeConnectionStates(merged));
}

}  // namespace webpubsub
