#pragma once

#include <cstdint>
#include <string>

#include "../codec/EnvelopeCodec.h"

// WebSocket close codes the gateway emits (RFC 6455 section 7.4).
enum class CloseCode : uint16_t {
  Normal = 1000,
  GoingAway = 1001,
  InvalidPayload = 1007,
  InternalError = 1011,
  TryAgainLater = 1013
};

// Client-facing leg of a session.
//
// readEnvelope() and writeEnvelope() may run concurrently from two threads,
// but each has a single caller: the inbound loop reads, the outbound loop
// writes. cancel() may be called from any thread. close() is called once
// neither loop is inside the connection any more.
class ClientConnection {
public:
  virtual ~ClientConnection() = default;

  // Blocks until one envelope arrives. Closed on client disconnect or after
  // cancel(); Error on malformed frames or transport failure.
  virtual IoStatus readEnvelope(InboundEnvelope &env) = 0;
  virtual IoStatus writeEnvelope(const OutboundEnvelope &env) = 0;

  // Starts the closing handshake with code and reason, which unblocks a
  // pending readEnvelope(). Does not wait. Idempotent; the first code wins.
  virtual void cancel(CloseCode code, const std::string &reason) = 0;

  // Sends a close frame unless cancel() already did, waits for the closing
  // handshake, then releases the connection. Idempotent.
  virtual void close(CloseCode code, const std::string &reason) = 0;

  virtual std::string peer() const = 0;
};
