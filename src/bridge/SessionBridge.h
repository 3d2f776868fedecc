#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "../client/ClientConnection.h"
#include "../upstream/UpstreamSession.h"
#include "BridgeError.h"

struct BridgeOptions {
  // Upstream chunks above this size end the session instead of being sent.
  size_t maxOutboundPayloadBytes = 1024 * 1024;
};

// Pairs one client connection with one upstream session and relays between
// them until either side ends.
//
// Two loops run for the lifetime of the session: inbound (client ->
// upstream) on a helper thread and outbound (upstream -> client) on the
// thread that calls run(). The first loop to hit a terminal condition moves
// the state Active -> Closing and cancels both legs, which unblocks the other
// loop. Legs are closed once, after both loops have exited, and only then
// does the state become Closed.
class SessionBridge {
public:
  enum class State { Active, Closing, Closed };

  SessionBridge(std::string id, std::unique_ptr<ClientConnection> client,
                std::unique_ptr<UpstreamSession> upstream, BridgeOptions opts);
  ~SessionBridge();

  SessionBridge(const SessionBridge &) = delete;
  SessionBridge &operator=(const SessionBridge &) = delete;

  // Blocks until the session is Closed. Returns why it ended.
  BridgeError run();

  // Shutdown request from outside the relay loops. No-op unless Active.
  void cancel(BridgeError reason);

  const std::string &id() const { return id_; }
  State state() const { return state_; }
  BridgeError reason() const { return reason_; }
  std::chrono::steady_clock::time_point lastActivity() const;

  uint64_t chunksToUpstream() const { return chunksIn_; }
  uint64_t chunksToClient() const { return chunksOut_; }

private:
  void inboundLoop();
  void outboundLoop();
  bool handleSignal(const SessionSignal &signal);
  bool beginShutdown(BridgeError reason, const std::string &detail = "");
  void notifyClient(const std::string &reason);
  void finalize();
  void touch();

  std::string id_;
  std::unique_ptr<ClientConnection> client_;
  std::unique_ptr<UpstreamSession> upstream_;
  BridgeOptions opts_;

  std::atomic<State> state_{State::Active};
  std::atomic<BridgeError> reason_{BridgeError::None};
  std::string detail_;
  std::mutex shutdownMutex_; // serialises beginShutdown() against finalize()

  std::atomic<int64_t> lastActivityMs_{0};
  std::atomic<uint64_t> chunksIn_{0};
  std::atomic<uint64_t> bytesIn_{0};
  std::atomic<uint64_t> chunksOut_{0};
  std::atomic<uint64_t> bytesOut_{0};

  std::thread inboundThread_;
};
