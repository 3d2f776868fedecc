#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "../codec/MediaTypes.h"

struct UpstreamConfig {
  std::string target;
  bool useTls = false;
  std::string apiKey;
  std::string model;
  std::string systemInstruction;
  std::vector<std::string> responseModalities;
  std::chrono::milliseconds connectTimeout{10000};
};

// Upstream leg of a session. send() is only called by the inbound loop and
// receive() only by the outbound loop; the two may run concurrently.
class UpstreamSession {
public:
  virtual ~UpstreamSession() = default;

  // Not retried. Error once the stream is broken or cancelled.
  virtual IoStatus send(const MediaChunk &chunk) = 0;

  // Blocks until the upstream yields a chunk or signal (Ok), ends the stream
  // cleanly (Closed), or fails (Error).
  virtual IoStatus receive(UpstreamEvent &event) = 0;

  // Unblocks pending send()/receive() calls. Idempotent.
  virtual void cancel() = 0;

  // Releases the connection. Idempotent; implementations also close on
  // destruction.
  virtual void close() = 0;
};

struct ConnectResult {
  std::unique_ptr<UpstreamSession> session;
  std::string error; // set when session is null
};

// Opens upstream sessions. One call per accepted client.
class UpstreamConnector {
public:
  virtual ~UpstreamConnector() = default;
  virtual ConnectResult open(const UpstreamConfig &config,
                             const std::string &sessionId) = 0;
};
