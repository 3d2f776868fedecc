#include "GrpcLiveSession.h"
#include "../app/Logger.h"
#include <future>

namespace {

constexpr const char *kDefaultOutputAudioType = "audio/pcm;rate=24000";

std::vector<uint8_t> toBytes(const std::string &s) {
  return std::vector<uint8_t>(s.begin(), s.end());
}

SessionSignal makeSignal(SessionSignal::Kind kind, std::string reason = "") {
  SessionSignal signal;
  signal.kind = kind;
  signal.reason = std::move(reason);
  return signal;
}

std::string describe(const grpc::Status &status) {
  return "grpc status " + std::to_string(status.error_code()) + ": " +
         status.error_message();
}

} // namespace

GrpcLiveSession::GrpcLiveSession(std::string sessionId,
                                 std::shared_ptr<grpc::Channel> channel)
    : sessionId_(std::move(sessionId)), channel_(std::move(channel)),
      stub_(live::LiveInference::NewStub(channel_)) {}

GrpcLiveSession::~GrpcLiveSession() { close(); }

live::ClientMessage GrpcLiveSession::buildSetup(const UpstreamConfig &config,
                                                const std::string &sessionId) {
  live::ClientMessage msg;
  auto setup = msg.mutable_setup();
  setup->set_model(config.model);
  setup->set_system_instruction(config.systemInstruction);
  for (const auto &modality : config.responseModalities) {
    setup->add_response_modalities(modality);
  }
  setup->set_session_id(sessionId);
  return msg;
}

live::ClientMessage GrpcLiveSession::buildInput(const MediaChunk &chunk) {
  live::ClientMessage msg;
  const auto &payload = chunk.payload();
  if (chunk.isText()) {
    auto content = msg.mutable_client_content();
    content->set_text(std::string(payload.begin(), payload.end()));
    content->set_end_of_turn(true);
  } else {
    auto input = msg.mutable_realtime_input();
    input->set_data(payload.data(), payload.size());
    input->set_mime_type(chunk.mediaType());
  }
  return msg;
}

bool GrpcLiveSession::handshake(const UpstreamConfig &config,
                                std::string &error) {
  context_ = std::make_unique<grpc::ClientContext>();
  if (!config.apiKey.empty()) {
    context_->AddMetadata("x-goog-api-key", config.apiKey);
  }
  context_->AddMetadata("x-session-id", sessionId_);

  stream_ = stub_->Session(context_.get());
  if (!stream_) {
    error = "failed to open upstream stream";
    return false;
  }

  if (!stream_->Write(buildSetup(config, sessionId_))) {
    error = setupFailure("upstream rejected session setup");
    return false;
  }

  // Read() has no deadline of its own; cancel the call if the
  // acknowledgement does not arrive in time.
  live::ServerMessage first;
  auto ack = std::async(std::launch::async,
                        [this, &first] { return stream_->Read(&first); });
  if (ack.wait_for(config.connectTimeout) != std::future_status::ready) {
    context_->TryCancel();
    ack.wait();
    error = "setup handshake timed out after " +
            std::to_string(config.connectTimeout.count()) + "ms";
    return false;
  }

  if (!ack.get()) {
    error = setupFailure("upstream closed during setup");
    return false;
  }

  if (first.has_error()) {
    error = "upstream refused setup: " + first.error().message();
    return false;
  }
  if (!first.has_setup_complete()) {
    error = "upstream sent content before acknowledging setup";
    return false;
  }

  SLOG_INFO(sessionId_, "Upstream session ready (model " << config.model << ")");
  return true;
}

// The call is already dead when Write() or Read() fails, so the final status
// is available without waiting.
std::string GrpcLiveSession::setupFailure(const std::string &what) {
  std::lock_guard<std::mutex> lock(closeMutex_);
  closed_ = true;

  live::ServerMessage discard;
  while (stream_->Read(&discard)) {
  }
  grpc::Status status = stream_->Finish();
  if (status.error_code() == grpc::StatusCode::UNAUTHENTICATED ||
      status.error_code() == grpc::StatusCode::PERMISSION_DENIED) {
    return "upstream authentication failed (" + describe(status) + ")";
  }
  return what + " (" + describe(status) + ")";
}

IoStatus GrpcLiveSession::send(const MediaChunk &chunk) {
  if (cancelled_ || closed_ || !stream_)
    return IoStatus::Error;

  if (!stream_->Write(buildInput(chunk))) {
    if (!cancelled_) {
      SLOG_WARN(sessionId_, "Upstream write failed (" << chunk.size() << " bytes, "
                                                      << chunk.mediaType() << ")");
    }
    return IoStatus::Error;
  }
  return IoStatus::Ok;
}

IoStatus GrpcLiveSession::receive(UpstreamEvent &event) {
  while (pending_.empty()) {
    if (cancelled_ || closed_ || !stream_)
      return IoStatus::Closed;

    live::ServerMessage msg;
    if (!stream_->Read(&msg)) {
      // The final status is collected by close(); Finish() may not run
      // while the inbound loop can still be writing.
      SLOG_DEBUG(sessionId_, "Upstream read stream ended");
      return IoStatus::Closed;
    }
    unpack(msg, pending_);
  }

  event = std::move(pending_.front());
  pending_.pop_front();
  return IoStatus::Ok;
}

void GrpcLiveSession::unpack(const live::ServerMessage &msg,
                             std::deque<UpstreamEvent> &out) {
  switch (msg.payload_case()) {
  case live::ServerMessage::kServerContent: {
    const auto &content = msg.server_content();
    for (const auto &part : content.parts()) {
      if (part.has_inline_data()) {
        const auto &inline_data = part.inline_data();
        if (inline_data.data().empty())
          continue;
        std::string type = inline_data.mime_type().empty()
                               ? kDefaultOutputAudioType
                               : inline_data.mime_type();
        out.push_back(MediaChunk(toBytes(inline_data.data()), std::move(type),
                                 Direction::Outbound));
      } else if (part.content_case() == live::Part::kText &&
                 !part.text().empty()) {
        out.push_back(
            MediaChunk(toBytes(part.text()), "text/plain", Direction::Outbound));
      }
    }
    if (content.interrupted())
      out.push_back(makeSignal(SessionSignal::Kind::Interrupted));
    if (content.generation_complete())
      out.push_back(makeSignal(SessionSignal::Kind::GenerationComplete));
    if (content.turn_complete())
      out.push_back(makeSignal(SessionSignal::Kind::TurnBoundary));
    break;
  }
  case live::ServerMessage::kError:
    out.push_back(makeSignal(SessionSignal::Kind::UpstreamError,
                             "upstream error " +
                                 std::to_string(msg.error().code()) + ": " +
                                 msg.error().message()));
    break;
  case live::ServerMessage::kGoAway:
    out.push_back(makeSignal(SessionSignal::Kind::UpstreamError,
                             "go away: " + msg.go_away().reason()));
    break;
  case live::ServerMessage::kSetupComplete:
  case live::ServerMessage::PAYLOAD_NOT_SET:
    break;
  }
}

void GrpcLiveSession::cancel() {
  if (cancelled_.exchange(true))
    return;
  // Unblocks Read()/Write() on both loops.
  if (context_)
    context_->TryCancel();
}

void GrpcLiveSession::close() {
  std::lock_guard<std::mutex> lock(closeMutex_);
  if (closed_.exchange(true))
    return;
  if (!stream_)
    return;

  cancelled_ = true;
  context_->TryCancel();

  live::ServerMessage discard;
  while (stream_->Read(&discard)) {
  }
  grpc::Status status = stream_->Finish();

  // Our own TryCancel() reports CANCELLED; a status the server sent before
  // that is reported unchanged.
  if (status.ok() || status.error_code() == grpc::StatusCode::CANCELLED) {
    SLOG_DEBUG(sessionId_, "Upstream stream released");
  } else {
    SLOG_WARN(sessionId_, "Upstream stream ended with " << describe(status));
  }
}

ConnectResult GrpcLiveConnector::open(const UpstreamConfig &config,
                                      const std::string &sessionId) {
  ConnectResult result;

  auto creds = config.useTls
                   ? grpc::SslCredentials(grpc::SslCredentialsOptions())
                   : grpc::InsecureChannelCredentials();
  auto channel = grpc::CreateChannel(config.target, creds);

  auto deadline = std::chrono::system_clock::now() + config.connectTimeout;
  if (!channel->WaitForConnected(deadline)) {
    result.error = "upstream " + config.target + " unreachable within " +
                   std::to_string(config.connectTimeout.count()) + "ms";
    return result;
  }

  auto session = std::make_unique<GrpcLiveSession>(sessionId, channel);
  std::string error;
  if (!session->handshake(config, error)) {
    result.error = error;
    return result;
  }

  result.session = std::move(session);
  return result;
}
