#include <catch2/catch.hpp>

#include <future>
#include <thread>

#include "upstream/GrpcLiveSession.h"

namespace {

std::string bytesOf(const MediaChunk &chunk) {
  return std::string(chunk.payload().begin(), chunk.payload().end());
}

// In-process LiveInference endpoint with scripted behaviour.
class ScriptedLiveService final : public live::LiveInference::Service {
public:
  enum class Mode {
    Echo,            // acknowledges setup, echoes audio back as one turn
    AckOnly,         // acknowledges setup, then sends nothing
    Silent,          // never acknowledges setup
    Unauthenticated, // rejects the call outright
  };

  explicit ScriptedLiveService(Mode mode) : mode_(mode) {}

  grpc::Status Session(grpc::ServerContext *context,
                       grpc::ServerReaderWriter<live::ServerMessage,
                                                live::ClientMessage> *stream) override {
    if (mode_ == Mode::Unauthenticated)
      return grpc::Status(grpc::StatusCode::UNAUTHENTICATED, "invalid api key");

    const auto &metadata = context->client_metadata();
    auto key = metadata.find("x-goog-api-key");

    live::ClientMessage msg;
    if (!stream->Read(&msg) || !msg.has_setup())
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "expected setup");
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (key != metadata.end())
        apiKey_.assign(key->second.data(), key->second.size());
      model_ = msg.setup().model();
    }

    if (mode_ == Mode::Silent)
      return waitForCancel(context);

    live::ServerMessage ack;
    ack.mutable_setup_complete()->set_session_handle("handle-1");
    stream->Write(ack);

    if (mode_ == Mode::AckOnly)
      return waitForCancel(context);

    while (stream->Read(&msg)) {
      if (!msg.has_realtime_input())
        continue;
      live::ServerMessage out;
      auto content = out.mutable_server_content();
      auto data = content->add_parts()->mutable_inline_data();
      data->set_data(msg.realtime_input().data());
      data->set_mime_type("audio/pcm;rate=24000");
      content->set_turn_complete(true);
      stream->Write(out);
    }
    return grpc::Status::OK;
  }

  std::string apiKey() {
    std::lock_guard<std::mutex> lock(mutex_);
    return apiKey_;
  }

  std::string model() {
    std::lock_guard<std::mutex> lock(mutex_);
    return model_;
  }

private:
  static grpc::Status waitForCancel(grpc::ServerContext *context) {
    while (!context->IsCancelled()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return grpc::Status::CANCELLED;
  }

  Mode mode_;
  std::mutex mutex_;
  std::string apiKey_;
  std::string model_;
};

struct LocalEndpoint {
  explicit LocalEndpoint(ScriptedLiveService::Mode mode) : service(mode) {
    grpc::ServerBuilder builder;
    builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port);
    builder.RegisterService(&service);
    server = builder.BuildAndStart();
  }

  ~LocalEndpoint() {
    if (server)
      server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
  }

  UpstreamConfig config(std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    UpstreamConfig cfg;
    cfg.target = "127.0.0.1:" + std::to_string(port);
    cfg.apiKey = "key-123";
    cfg.model = "live-model";
    cfg.connectTimeout = timeout;
    return cfg;
  }

  ScriptedLiveService service;
  int port = 0;
  std::unique_ptr<grpc::Server> server;
};

constexpr auto kWait = std::chrono::seconds(5);

} // namespace

TEST_CASE("Setup message carries model and session settings", "[grpc]") {
  UpstreamConfig cfg;
  cfg.model = "live-model";
  cfg.systemInstruction = "be brief";
  cfg.responseModalities = {"AUDIO", "TEXT"};

  auto msg = GrpcLiveSession::buildSetup(cfg, "sess-1");
  REQUIRE(msg.payload_case() == live::ClientMessage::kSetup);
  CHECK(msg.setup().model() == "live-model");
  CHECK(msg.setup().system_instruction() == "be brief");
  REQUIRE(msg.setup().response_modalities_size() == 2);
  CHECK(msg.setup().response_modalities(1) == "TEXT");
  CHECK(msg.setup().session_id() == "sess-1");
}

TEST_CASE("Audio chunks become realtime input", "[grpc]") {
  MediaChunk chunk({0x00, 0x01, 0x02}, "audio/pcm;rate=16000", Direction::Inbound);

  auto msg = GrpcLiveSession::buildInput(chunk);
  REQUIRE(msg.payload_case() == live::ClientMessage::kRealtimeInput);
  CHECK(msg.realtime_input().data() == std::string("\x00\x01\x02", 3));
  CHECK(msg.realtime_input().mime_type() == "audio/pcm;rate=16000");
}

TEST_CASE("Text chunks become a completed client turn", "[grpc]") {
  std::string text = "hello";
  MediaChunk chunk(std::vector<uint8_t>(text.begin(), text.end()), "text/plain",
                   Direction::Inbound);

  auto msg = GrpcLiveSession::buildInput(chunk);
  REQUIRE(msg.payload_case() == live::ClientMessage::kClientContent);
  CHECK(msg.client_content().text() == "hello");
  CHECK(msg.client_content().end_of_turn());
}

TEST_CASE("Server content is flattened in wire order", "[grpc]") {
  live::ServerMessage msg;
  auto content = msg.mutable_server_content();
  auto audio = content->add_parts()->mutable_inline_data();
  audio->set_data(std::string("\x01\x02", 2));
  audio->set_mime_type("audio/pcm;rate=24000");
  content->add_parts()->set_text("transcript");
  content->add_parts()->mutable_inline_data(); // empty, skipped
  content->set_interrupted(true);
  content->set_generation_complete(true);
  content->set_turn_complete(true);

  std::deque<UpstreamEvent> events;
  GrpcLiveSession::unpack(msg, events);
  REQUIRE(events.size() == 5);

  const auto &first = std::get<MediaChunk>(events[0]);
  CHECK(bytesOf(first) == std::string("\x01\x02", 2));
  CHECK(first.mediaType() == "audio/pcm;rate=24000");
  CHECK(first.direction() == Direction::Outbound);

  const auto &second = std::get<MediaChunk>(events[1]);
  CHECK(second.isText());
  CHECK(bytesOf(second) == "transcript");

  CHECK(std::get<SessionSignal>(events[2]).kind == SessionSignal::Kind::Interrupted);
  CHECK(std::get<SessionSignal>(events[3]).kind ==
        SessionSignal::Kind::GenerationComplete);
  CHECK(std::get<SessionSignal>(events[4]).kind == SessionSignal::Kind::TurnBoundary);
}

TEST_CASE("Inline data without a type defaults to 24 kHz PCM", "[grpc]") {
  live::ServerMessage msg;
  msg.mutable_server_content()->add_parts()->mutable_inline_data()->set_data("x");

  std::deque<UpstreamEvent> events;
  GrpcLiveSession::unpack(msg, events);
  REQUIRE(events.size() == 1);
  CHECK(std::get<MediaChunk>(events[0]).mediaType() == "audio/pcm;rate=24000");
}

TEST_CASE("Server errors and go-away become upstream errors", "[grpc]") {
  std::deque<UpstreamEvent> events;

  live::ServerMessage error;
  error.mutable_error()->set_code(8);
  error.mutable_error()->set_message("quota");
  GrpcLiveSession::unpack(error, events);

  live::ServerMessage goAway;
  goAway.mutable_go_away()->set_reason("maintenance");
  GrpcLiveSession::unpack(goAway, events);

  REQUIRE(events.size() == 2);
  const auto &first = std::get<SessionSignal>(events[0]);
  CHECK(first.kind == SessionSignal::Kind::UpstreamError);
  CHECK(first.reason == "upstream error 8: quota");
  const auto &second = std::get<SessionSignal>(events[1]);
  CHECK(second.kind == SessionSignal::Kind::UpstreamError);
  CHECK(second.reason == "go away: maintenance");
}

TEST_CASE("Setup acknowledgements produce no events", "[grpc]") {
  live::ServerMessage msg;
  msg.mutable_setup_complete()->set_session_handle("h");

  std::deque<UpstreamEvent> events;
  GrpcLiveSession::unpack(msg, events);
  CHECK(events.empty());
}

TEST_CASE("Sessions open against a live endpoint and relay audio", "[grpc]") {
  LocalEndpoint endpoint(ScriptedLiveService::Mode::Echo);
  REQUIRE(endpoint.server);

  GrpcLiveConnector connector;
  auto result = connector.open(endpoint.config(), "sess-echo");
  REQUIRE(result.session);
  CHECK(result.error.empty());
  CHECK(endpoint.service.apiKey() == "key-123");
  CHECK(endpoint.service.model() == "live-model");

  auto &session = *result.session;
  MediaChunk chunk({0x01, 0x02, 0x03}, "audio/pcm;rate=16000", Direction::Inbound);
  REQUIRE(session.send(chunk) == IoStatus::Ok);

  UpstreamEvent event;
  REQUIRE(session.receive(event) == IoStatus::Ok);
  const auto &audio = std::get<MediaChunk>(event);
  CHECK(bytesOf(audio) == std::string("\x01\x02\x03", 3));
  CHECK(audio.mediaType() == "audio/pcm;rate=24000");

  REQUIRE(session.receive(event) == IoStatus::Ok);
  CHECK(std::get<SessionSignal>(event).kind == SessionSignal::Kind::TurnBoundary);

  session.close();
}

TEST_CASE("An endpoint that never acknowledges setup fails the handshake", "[grpc]") {
  LocalEndpoint endpoint(ScriptedLiveService::Mode::Silent);
  REQUIRE(endpoint.server);

  GrpcLiveConnector connector;
  auto started = std::chrono::steady_clock::now();
  auto result = connector.open(endpoint.config(std::chrono::milliseconds(300)), "sess-slow");

  CHECK_FALSE(result.session);
  CHECK_THAT(result.error, Catch::Contains("timed out"));
  bool boundedByTimeout = std::chrono::steady_clock::now() - started < kWait;
  CHECK(boundedByTimeout);
}

TEST_CASE("Rejected credentials are reported as an authentication failure", "[grpc]") {
  LocalEndpoint endpoint(ScriptedLiveService::Mode::Unauthenticated);
  REQUIRE(endpoint.server);

  GrpcLiveConnector connector;
  auto result = connector.open(endpoint.config(), "sess-auth");

  CHECK_FALSE(result.session);
  CHECK_THAT(result.error, Catch::Contains("authentication failed"));
  CHECK_THAT(result.error, Catch::Contains("invalid api key"));
}

TEST_CASE("An unreachable endpoint is reported without a handshake", "[grpc]") {
  UpstreamConfig cfg;
  cfg.target = "127.0.0.1:1";
  cfg.connectTimeout = std::chrono::milliseconds(200);

  GrpcLiveConnector connector;
  auto result = connector.open(cfg, "sess-none");
  CHECK_FALSE(result.session);
  CHECK_THAT(result.error, Catch::Contains("unreachable"));
}

TEST_CASE("cancel unblocks a pending receive", "[grpc]") {
  LocalEndpoint endpoint(ScriptedLiveService::Mode::AckOnly);
  REQUIRE(endpoint.server);

  GrpcLiveConnector connector;
  auto result = connector.open(endpoint.config(), "sess-cancel");
  REQUIRE(result.session);
  auto &session = *result.session;

  auto pending = std::async(std::launch::async, [&session] {
    UpstreamEvent event;
    return session.receive(event);
  });
  CHECK(pending.wait_for(std::chrono::milliseconds(50)) == std::future_status::timeout);

  session.cancel();
  REQUIRE(pending.wait_for(kWait) == std::future_status::ready);
  CHECK(pending.get() == IoStatus::Closed);
  CHECK(session.send(MediaChunk({0x01}, "audio/pcm", Direction::Inbound)) ==
        IoStatus::Error);
}

TEST_CASE("close is safe to repeat", "[grpc]") {
  LocalEndpoint endpoint(ScriptedLiveService::Mode::AckOnly);
  REQUIRE(endpoint.server);

  GrpcLiveConnector connector;
  auto result = connector.open(endpoint.config(), "sess-close");
  REQUIRE(result.session);
  auto &session = *result.session;

  session.close();
  session.close();
  session.cancel();

  UpstreamEvent event;
  CHECK(session.receive(event) == IoStatus::Closed);
  CHECK(session.send(MediaChunk({0x01}, "audio/pcm", Direction::Inbound)) ==
        IoStatus::Error);
}
