/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행하고, 종료 신호를 받으면 세션을 정리한 뒤 내려간다.
 * 버전: v1.0.0
 * 관련 문서: docs/wire-protocol.md
 * 테스트: server/tests/e2e/arena_flow_test.cpp
 */
#include <csignal>
#include <exception>
#include <iostream>

#include <boost/asio/signal_set.hpp>

#include "arena/app.hpp"

int main() {
  using namespace arena;
  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "환경설정 오류: " << ex.what() << "\n";
    return 1;
  }
  ServerApp app(config);

  boost::asio::signal_set signals(app.GetContext(), SIGINT, SIGTERM);
  signals.async_wait([&app](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    std::cout << "신호 " << signal_number << " 수신, 종료를 준비합니다\n";
    app.GetContext().stop();
  });

  app.Run();
  // 최종 점수 쓰기가 플러시될 때까지 기다린다.
  app.Stop();
  return 0;
}
