#include "BridgeService.h"
#include "../app/Logger.h"
#include <cstdio>
#include <random>

BridgeService::BridgeService(SessionRegistry &registry,
                             UpstreamConnector &connector,
                             UpstreamConfig upstreamConfig,
                             BridgeOptions options)
    : registry_(registry), connector_(connector),
      upstreamConfig_(std::move(upstreamConfig)), options_(options) {}

// Random version 4 UUID, 8-4-4-4-12 hex.
std::string BridgeService::newSessionId() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

  char buf[37];
  std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                static_cast<unsigned>(hi >> 32),
                static_cast<unsigned>((hi >> 16) & 0xffff),
                static_cast<unsigned>(hi & 0xffff),
                static_cast<unsigned>(lo >> 48),
                static_cast<unsigned long long>(lo & 0xffffffffffffULL));
  return buf;
}

BridgeError BridgeService::serve(std::unique_ptr<ClientConnection> client) {
  auto ticket = registry_.admit();
  if (ticket)
    return serve(std::move(client), std::move(ticket));

  std::string peer = client->peer();
  if (registry_.shuttingDown()) {
    LOG_WARN("Rejecting client " << peer << ": server shutting down");
    client->close(closeCodeFor(BridgeError::Shutdown), "server shutting down");
    return BridgeError::Shutdown;
  }

  LOG_WARN("Rejecting client " << peer << ": capacity exceeded ("
                               << registry_.count() << "/"
                               << registry_.maxSessions() << ")");
  client->close(closeCodeFor(BridgeError::CapacityExceeded), "capacity exceeded");
  return BridgeError::CapacityExceeded;
}

BridgeError BridgeService::serve(std::unique_ptr<ClientConnection> client,
                                 SessionRegistry::Ticket ticket) {
  std::string sessionId = newSessionId();
  std::string peer = client->peer();

  SLOG_INFO(sessionId, "Connecting upstream " << upstreamConfig_.target
                                              << " for client " << peer);
  ConnectResult result = connector_.open(upstreamConfig_, sessionId);
  if (!result.session) {
    SLOG_ERROR(sessionId, "Upstream connect failed: " << result.error);
    client->close(closeCodeFor(BridgeError::ConnectError), "upstream unavailable");
    return BridgeError::ConnectError;
  }

  auto bridge = std::make_shared<SessionBridge>(
      sessionId, std::move(client), std::move(result.session), options_);

  if (!registry_.registerSession(ticket, bridge)) {
    // Shutdown started while the upstream was connecting; run() tears the
    // legs down without relaying anything.
    bridge->cancel(BridgeError::Shutdown);
    return bridge->run();
  }

  BridgeError outcome = bridge->run();
  registry_.unregister(sessionId);
  return outcome;
}
