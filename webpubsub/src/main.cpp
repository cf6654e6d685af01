/*
 * 설명: 웹훅 서버 진입점으로 환경설정을 로드하고 에코 핸들러로 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include <csignal>
#include <iostream>

#include "webpubsub/app.hpp"

namespace {
// 연결 시 메시지 카운터를 심고, 사용자 메시지는 그대로 돌려주며 카운터를 올린다.
std::optional<webpubsub::HandlerOutput> EchoHandler(const webpubsub::WebPubSubEvent& event) {
  using namespace webpubsub;
  switch (event.request_type) {
    case RequestType::kConnect: {
      ConnectResponse response;
      response.user_id = event.connection.user_id;
      response.states["messageCount"] = 0;
      return HandlerOutput{response};
    }
    case RequestType::kUser: {
      int count = 0;
      auto it = event.states.find("messageCount");
      if (it != event.states.end() && it->second.is_number_integer()) {
        count = it->second.get<int>();
      }
      UserResponse response;
      response.data = event.data;
      response.data_type = event.data_type;
      response.states["messageCount"] = count + 1;
      return HandlerOutput{response};
    }
    default:
      return std::nullopt;
  }
}
}  // namespace

int main() {
  using namespace webpubsub;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config, EchoHandler);

  std::signal(SIGINT, [](int) {
    std::cout << "SIGINT 수신, 종료를 준비합니다\n";
  });

  app.Run();
  return 0;
}
