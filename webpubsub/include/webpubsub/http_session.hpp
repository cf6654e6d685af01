/*
 * 설명: HTTP 연결 하나를 읽어 웹훅 서비스에 넘기고 응답을 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/e2e/webhook_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "webpubsub/config.hpp"
#include "webpubsub/observability.hpp"
#include "webpubsub/protocol.hpp"
#include "webpubsub/webhook_service.hpp"

namespace webpubsub {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<WebhookService> webhook_service, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<HttpResponse> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  HttpRequest req_;
  AppConfig config_;
  std::shared_ptr<WebhookService> webhook_service_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace webpubsub
