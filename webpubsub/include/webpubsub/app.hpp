/*
 * 설명: 웹훅 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: webpubsub/tests/e2e/webhook_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "webpubsub/config.hpp"
#include "webpubsub/observability.hpp"
#include "webpubsub/webhook_service.hpp"

namespace webpubsub {

class Listener;

class ServerApp {
 public:
  ServerApp(const AppConfig& config, EventHandler handler);
  ~ServerApp();

  void Run();
  void Stop();

  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<WebhookService> webhook_service_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
};

}  // namespace webpubsub
