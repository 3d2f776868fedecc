#include "SessionBridge.h"
#include "../app/Logger.h"
#include <system_error>

namespace {

int64_t steadyNowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::steady_clock::now().time_since_epoch())
      .count();
}

std::string closeReasonFor(BridgeError reason, const std::string &detail) {
  if (reason == BridgeError::ClientClosed)
    return "";
  return detail.empty() ? toString(reason) : detail;
}

} // namespace

SessionBridge::SessionBridge(std::string id,
                             std::unique_ptr<ClientConnection> client,
                             std::unique_ptr<UpstreamSession> upstream,
                             BridgeOptions opts)
    : id_(std::move(id)), client_(std::move(client)),
      upstream_(std::move(upstream)), opts_(opts) {
  touch();
}

SessionBridge::~SessionBridge() {
  if (inboundThread_.joinable()) {
    beginShutdown(BridgeError::Shutdown);
    inboundThread_.join();
  }
}

std::chrono::steady_clock::time_point SessionBridge::lastActivity() const {
  return std::chrono::steady_clock::time_point(
      std::chrono::milliseconds(lastActivityMs_.load()));
}

void SessionBridge::touch() { lastActivityMs_ = steadyNowMs(); }

BridgeError SessionBridge::run() {
  SLOG_INFO(id_, "Bridging client " << client_->peer() << " to upstream");

  try {
    inboundThread_ = std::thread(&SessionBridge::inboundLoop, this);
  } catch (const std::system_error &e) {
    SLOG_ERROR(id_, "Failed to start inbound relay: " << e.what());
    beginShutdown(BridgeError::Shutdown, "gateway overloaded");
    finalize();
    return reason_;
  }

  outboundLoop();

  if (inboundThread_.joinable())
    inboundThread_.join();

  finalize();
  return reason_;
}

void SessionBridge::cancel(BridgeError reason) { beginShutdown(reason); }

bool SessionBridge::beginShutdown(BridgeError reason, const std::string &detail) {
  std::lock_guard<std::mutex> lock(shutdownMutex_);
  State expected = State::Active;
  if (!state_.compare_exchange_strong(expected, State::Closing))
    return false;

  reason_ = reason;
  detail_ = detail;
  if (detail.empty()) {
    SLOG_INFO(id_, "Session closing: " << toString(reason));
  } else {
    SLOG_INFO(id_, "Session closing: " << toString(reason) << " (" << detail << ")");
  }

  upstream_->cancel();
  client_->cancel(closeCodeFor(reason), closeReasonFor(reason, detail));
  return true;
}

void SessionBridge::inboundLoop() {
  while (state_ == State::Active) {
    InboundEnvelope env;
    IoStatus status = client_->readEnvelope(env);
    if (status == IoStatus::Closed) {
      beginShutdown(BridgeError::ClientClosed);
      break;
    }
    if (status == IoStatus::Error) {
      beginShutdown(BridgeError::ReadError, "invalid client frame");
      break;
    }

    auto chunk = EnvelopeCodec::decodeInbound(env);
    if (!chunk) {
      SLOG_WARN(id_, "Malformed envelope from client (mime_type '"
                         << env.mimeType << "', " << env.data.size()
                         << " bytes of data)");
      beginShutdown(BridgeError::MalformedEnvelope, "malformed envelope");
      break;
    }

    if (upstream_->send(*chunk) != IoStatus::Ok) {
      beginShutdown(BridgeError::SendError, "upstream send failed");
      break;
    }

    chunksIn_++;
    bytesIn_ += chunk->size();
    touch();
  }
  SLOG_DEBUG(id_, "Inbound relay stopped");
}

void SessionBridge::outboundLoop() {
  while (state_ == State::Active) {
    UpstreamEvent event;
    IoStatus status = upstream_->receive(event);
    if (status == IoStatus::Closed) {
      beginShutdown(BridgeError::UpstreamClosed, "upstream closed");
      break;
    }
    if (status == IoStatus::Error) {
      beginShutdown(BridgeError::ReceiveError, "upstream receive failed");
      break;
    }

    if (auto *signal = std::get_if<SessionSignal>(&event)) {
      if (!handleSignal(*signal))
        break;
      continue;
    }

    const MediaChunk &chunk = std::get<MediaChunk>(event);
    auto env = EnvelopeCodec::encodeOutbound(chunk, opts_.maxOutboundPayloadBytes);
    if (!env) {
      SLOG_ERROR(id_, "Upstream chunk of " << chunk.size()
                                           << " bytes exceeds the "
                                           << opts_.maxOutboundPayloadBytes
                                           << " byte limit");
      notifyClient("upstream produced an oversized chunk");
      beginShutdown(BridgeError::UnencodableChunk, "oversized upstream chunk");
      break;
    }

    status = client_->writeEnvelope(*env);
    if (status != IoStatus::Ok) {
      beginShutdown(status == IoStatus::Closed ? BridgeError::ClientClosed
                                               : BridgeError::WriteError);
      break;
    }

    chunksOut_++;
    bytesOut_ += chunk.size();
    touch();
  }
  SLOG_DEBUG(id_, "Outbound relay stopped");
}

bool SessionBridge::handleSignal(const SessionSignal &signal) {
  if (signal.kind == SessionSignal::Kind::UpstreamError) {
    SLOG_WARN(id_, "Upstream reported: " << signal.reason);
    notifyClient(signal.reason);
    beginShutdown(BridgeError::UpstreamError, signal.reason);
    return false;
  }

  auto env = EnvelopeCodec::mapSignal(signal);
  if (!env) {
    SLOG_DEBUG(id_, "Dropping upstream signal " << toString(signal.kind));
    return true;
  }

  IoStatus status = client_->writeEnvelope(*env);
  if (status != IoStatus::Ok) {
    beginShutdown(status == IoStatus::Closed ? BridgeError::ClientClosed
                                             : BridgeError::WriteError);
    return false;
  }
  touch();
  return true;
}

// Final diagnostic frame. Only the outbound loop calls this, so the
// single-writer rule on the client leg still holds.
void SessionBridge::notifyClient(const std::string &reason) {
  if (client_->writeEnvelope(EnvelopeCodec::errorEnvelope(reason)) != IoStatus::Ok) {
    SLOG_DEBUG(id_, "Could not deliver error frame to client");
  }
}

void SessionBridge::finalize() {
  std::lock_guard<std::mutex> lock(shutdownMutex_);
  if (state_ == State::Closed)
    return;

  BridgeError reason = reason_;
  upstream_->close();
  client_->close(closeCodeFor(reason), closeReasonFor(reason, detail_));
  state_ = State::Closed;

  SLOG_INFO(id_, "Session closed (" << toString(reason) << "): "
                                    << chunksIn_.load() << " chunks/"
                                    << bytesIn_.load() << " bytes to upstream, "
                                    << chunksOut_.load() << " chunks/"
                                    << bytesOut_.load() << " bytes to client");
}
