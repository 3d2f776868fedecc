#include "BridgeError.h"

const char *toString(BridgeError err) {
  switch (err) {
  case BridgeError::None:
    return "None";
  case BridgeError::ClientClosed:
    return "ClientClosed";
  case BridgeError::UpstreamClosed:
    return "UpstreamClosed";
  case BridgeError::MalformedEnvelope:
    return "MalformedEnvelope";
  case BridgeError::ConnectError:
    return "ConnectError";
  case BridgeError::SendError:
    return "SendError";
  case BridgeError::ReceiveError:
    return "ReceiveError";
  case BridgeError::ReadError:
    return "ReadError";
  case BridgeError::WriteError:
    return "WriteError";
  case BridgeError::CapacityExceeded:
    return "CapacityExceeded";
  case BridgeError::UnencodableChunk:
    return "UnencodableChunk";
  case BridgeError::UpstreamError:
    return "UpstreamError";
  case BridgeError::IdleTimeout:
    return "IdleTimeout";
  case BridgeError::Shutdown:
    return "Shutdown";
  }
  return "Unknown";
}

CloseCode closeCodeFor(BridgeError err) {
  switch (err) {
  case BridgeError::None:
  case BridgeError::ClientClosed:
    return CloseCode::Normal;
  case BridgeError::MalformedEnvelope:
  case BridgeError::ReadError:
    return CloseCode::InvalidPayload;
  case BridgeError::CapacityExceeded:
    return CloseCode::TryAgainLater;
  case BridgeError::IdleTimeout:
  case BridgeError::Shutdown:
    return CloseCode::GoingAway;
  case BridgeError::UpstreamClosed:
  case BridgeError::ConnectError:
  case BridgeError::SendError:
  case BridgeError::ReceiveError:
  case BridgeError::WriteError:
  case BridgeError::UnencodableChunk:
  case BridgeError::UpstreamError:
    return CloseCode::InternalError;
  }
  return CloseCode::InternalError;
}
