#pragma once

#include "../client/ClientConnection.h"

// Why a session ended (or never started).
enum class BridgeError {
  None,
  ClientClosed,
  UpstreamClosed,
  MalformedEnvelope,
  ConnectError,
  SendError,
  ReceiveError,
  ReadError,
  WriteError,
  CapacityExceeded,
  UnencodableChunk,
  UpstreamError,
  IdleTimeout,
  Shutdown
};

const char *toString(BridgeError err);

// Close code the client sees when a session ends for this reason.
CloseCode closeCodeFor(BridgeError err);
