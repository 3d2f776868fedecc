#pragma once

#include <memory>
#include <string>

#include "../client/ClientConnection.h"
#include "../upstream/UpstreamSession.h"
#include "SessionBridge.h"
#include "SessionRegistry.h"

// Takes an accepted client through admission, upstream setup and the
// lifetime of its session bridge.
class BridgeService {
public:
  BridgeService(SessionRegistry &registry, UpstreamConnector &connector,
                UpstreamConfig upstreamConfig, BridgeOptions options);

  // Blocks the calling thread until the session is over. Sessions that are
  // refused (capacity, shutdown, upstream unavailable) are never registered.
  BridgeError serve(std::unique_ptr<ClientConnection> client);

  // Same, for a client whose slot was reserved before its handshake.
  BridgeError serve(std::unique_ptr<ClientConnection> client,
                    SessionRegistry::Ticket ticket);

  static std::string newSessionId();

private:
  SessionRegistry &registry_;
  UpstreamConnector &connector_;
  UpstreamConfig upstreamConfig_;
  BridgeOptions options_;
};
