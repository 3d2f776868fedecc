#include "GatewayApp.h"
#include "../util/Net.h"
#include "Config.h"
#include "Logger.h"
#include "SignalHandler.h"
#include <iostream>
#include <poll.h>
#include <system_error>
#include <unistd.h>

GatewayApp::GatewayApp() {}

GatewayApp::~GatewayApp() {
  running_ = false;
  if (cliThread_.joinable())
    cliThread_.join();
  reapWorkers(true);
  Net::closeSocket(listenFd_);
}

bool GatewayApp::init(const std::string &configPath) {
  if (!Config::instance().load(configPath))
    return false;

  auto &config = Config::instance();
  Logger::instance().setLevel(Logger::parseLevel(config.logLevel));

  wsOptions_.path = config.wsPath;
  wsOptions_.handshakeTimeout = std::chrono::milliseconds(config.handshakeTimeoutMs);
  wsOptions_.writeTimeout = std::chrono::milliseconds(config.writeTimeoutMs);
  wsOptions_.maxMessageBytes = config.maxMessageBytes;
  idleTimeout_ = std::chrono::milliseconds(config.idleTimeoutMs);

  registry_ = std::make_unique<SessionRegistry>(config.maxSessions);
  connector_ = std::make_unique<GrpcLiveConnector>();
  service_ = std::make_unique<BridgeService>(*registry_, *connector_,
                                             config.upstreamConfig(),
                                             config.bridgeOptions());

  listenFd_ = Net::createTcpListener(config.bindIp, config.port);
  if (listenFd_ < 0)
    return false;

  LOG_INFO("Listening on ws://" << config.bindIp << ":" << config.port
                                << config.wsPath << ", upstream "
                                << config.upstreamTarget << ", max sessions "
                                << config.maxSessions);
  return true;
}

void GatewayApp::run() {
  running_ = true;
  cliThread_ = std::thread(&GatewayApp::cliLoop, this);

  LOG_INFO("Gateway running. Press Ctrl+C to exit.");

  auto lastSweep = std::chrono::steady_clock::now();
  while (running_ && !SignalHandler::shouldExit()) {
    acceptPending();

    auto now = std::chrono::steady_clock::now();
    if (now - lastSweep >= std::chrono::seconds(1)) {
      lastSweep = now;
      registry_->reapIdle(idleTimeout_);
      reapWorkers(false);
    }
  }

  if (SignalHandler::lastSignal() != 0)
    LOG_INFO("Received signal " << SignalHandler::lastSignal() << ", exiting...");

  running_ = false;
  LOG_INFO("Shutting down...");

  Net::closeSocket(listenFd_);
  listenFd_ = -1;

  registry_->shutdownAll();
  reapWorkers(true);

  if (cliThread_.joinable())
    cliThread_.join();
  LOG_INFO("Shutdown complete");
}

void GatewayApp::acceptPending() {
  sockaddr_in peer{};
  int fd = Net::acceptConnection(listenFd_, 100, peer);
  if (fd < 0)
    return;

  LOG_DEBUG("Accepted TCP connection from " << Net::ipFromSockAddr(peer) << ":"
                                            << Net::portFromSockAddr(peer));

  // The slot is reserved before any thread or handshake is spent on the
  // connection.
  auto ticket = registry_->admit();
  if (!ticket) {
    LOG_WARN("Rejecting " << Net::ipFromSockAddr(peer) << ":"
                          << Net::portFromSockAddr(peer) << ": "
                          << (registry_->shuttingDown() ? "server shutting down"
                                                        : "capacity exceeded"));
    WebSocketConnection::rejectBusy(fd);
    return;
  }

  Worker worker;
  worker.done = std::make_shared<std::atomic<bool>>(false);
  auto done = worker.done;
  try {
    worker.thread = std::thread([this, fd, done, ticket = std::move(ticket)]() mutable {
      handleConnection(fd, std::move(ticket));
      *done = true;
    });
  } catch (const std::system_error &e) {
    LOG_ERROR("Failed to start connection worker: " << e.what());
    Net::closeSocket(fd);
    return;
  }
  workers_.push_back(std::move(worker));
}

void GatewayApp::handleConnection(int fd, SessionRegistry::Ticket ticket) {
  try {
    auto conn = std::make_unique<WebSocketConnection>(fd, wsOptions_);
    if (!conn->accept())
      return;

    BridgeError outcome = service_->serve(std::move(conn), std::move(ticket));
    LOG_DEBUG("Connection worker finished: " << toString(outcome));
  } catch (const std::exception &e) {
    LOG_ERROR("Connection worker failed: " << e.what());
  }
}

void GatewayApp::reapWorkers(bool joinAll) {
  for (auto it = workers_.begin(); it != workers_.end();) {
    if (joinAll || *it->done) {
      if (it->thread.joinable())
        it->thread.join();
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
}

void GatewayApp::cliLoop() {
  std::string line;
  while (running_) {
    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    int ret = ::poll(&pfd, 1, 200);
    if (ret <= 0)
      continue;
    if (!(pfd.revents & POLLIN) || !std::getline(std::cin, line))
      break;

    if (line == "list") {
      auto ids = registry_->sessionIds();
      LOG_INFO("Active sessions: " << ids.size());
      for (const auto &id : ids) {
        auto bridge = registry_->find(id);
        if (bridge) {
          LOG_INFO("  " << id << " up " << bridge->chunksToUpstream()
                        << " down " << bridge->chunksToClient());
        }
      }
    } else if (line.find("cut ") == 0) {
      std::string id = line.substr(4);
      auto bridge = registry_->find(id);
      if (bridge) {
        bridge->cancel(BridgeError::Shutdown);
        LOG_INFO("Cut session " << id);
      } else {
        LOG_WARN("No session " << id);
      }
    } else if (line == "exit" || line == "quit") {
      SignalHandler::setExit();
    }
  }
}
