#pragma once

#include "../bridge/BridgeService.h"
#include "../bridge/SessionRegistry.h"
#include "../client/WebSocketConnection.h"
#include "../upstream/GrpcLiveSession.h"
#include <atomic>
#include <chrono>
#include <list>
#include <memory>
#include <string>
#include <thread>

class GatewayApp {
public:
  GatewayApp();
  ~GatewayApp();

  bool init(const std::string &configPath);
  void run();

private:
  struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void acceptPending();
  void handleConnection(int fd, SessionRegistry::Ticket ticket);
  void reapWorkers(bool joinAll);
  void cliLoop();

  int listenFd_ = -1;
  std::atomic<bool> running_{false};
  std::thread cliThread_;

  std::unique_ptr<SessionRegistry> registry_;
  std::unique_ptr<GrpcLiveConnector> connector_;
  std::unique_ptr<BridgeService> service_;
  WebSocketConnection::Options wsOptions_;
  std::chrono::milliseconds idleTimeout_{0};

  // Only touched by the accept loop.
  std::list<Worker> workers_;
};
