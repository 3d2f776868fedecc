#include <catch2/catch.hpp>

#include <future>
#include <thread>

#include "bridge/SessionBridge.h"
#include "fakes/FakeLegs.h"

namespace {

// Owns the two fakes until the bridge takes them, keeps their traces after.
struct Harness {
  explicit Harness(BridgeOptions opts = BridgeOptions()) {
    auto clientLeg = std::make_unique<FakeClient>();
    auto upstreamLeg = std::make_unique<FakeUpstream>();
    client = clientLeg.get();
    upstream = upstreamLeg.get();
    clientTrace = clientLeg->trace();
    upstreamTrace = upstreamLeg->trace();
    bridge = std::make_shared<SessionBridge>("test-session", std::move(clientLeg),
                                             std::move(upstreamLeg), opts);
  }

  FakeClient *client;
  FakeUpstream *upstream;
  std::shared_ptr<ClientTrace> clientTrace;
  std::shared_ptr<UpstreamTrace> upstreamTrace;
  std::shared_ptr<SessionBridge> bridge;
};

std::string payloadOf(const MediaChunk &chunk) {
  return std::string(chunk.payload().begin(), chunk.payload().end());
}

const auto kWait = std::chrono::seconds(5);

} // namespace

TEST_CASE("Client chunks reach the upstream in order", "[bridge]") {
  Harness h;
  h.client->pushMedia("YQ==", "audio/pcm;rate=16000"); // "a"
  h.client->pushMedia("Yg==", "audio/pcm;rate=16000"); // "b"
  h.client->pushText("c");
  h.client->disconnect();

  CHECK(h.bridge->run() == BridgeError::ClientClosed);
  CHECK(h.bridge->state() == SessionBridge::State::Closed);

  REQUIRE(h.upstreamTrace->sent.size() == 3);
  CHECK(payloadOf(h.upstreamTrace->sent[0]) == "a");
  CHECK(payloadOf(h.upstreamTrace->sent[1]) == "b");
  CHECK(payloadOf(h.upstreamTrace->sent[2]) == "c");
  CHECK(h.upstreamTrace->sent[0].mediaType() == "audio/pcm;rate=16000");
  CHECK(h.upstreamTrace->sent[2].mediaType() == "text/plain");
  CHECK(h.bridge->chunksToUpstream() == 3);

  CHECK(h.clientTrace->closeCalls == 1);
  CHECK(h.clientTrace->closeCode == CloseCode::Normal);
  CHECK(h.upstreamTrace->closeCalls == 1);
}

TEST_CASE("Upstream chunks reach the client in order", "[bridge]") {
  Harness h;
  h.upstream->pushAudio({0x00, 0x01, 0x02});
  h.upstream->pushAudio({0xff});
  h.upstream->push(MediaChunk({'o', 'k'}, "text/plain", Direction::Outbound));
  h.upstream->end();

  CHECK(h.bridge->run() == BridgeError::UpstreamClosed);

  auto &written = h.clientTrace->written;
  REQUIRE(written.size() == 3);
  CHECK(written[0].kind == OutboundEnvelope::Kind::Audio);
  CHECK(written[0].body == "AAEC");
  CHECK(written[1].body == "/w==");
  CHECK(written[2].kind == OutboundEnvelope::Kind::Text);
  CHECK(written[2].body == "ok");
  CHECK(h.bridge->chunksToClient() == 3);

  CHECK(h.clientTrace->closeCalls == 1);
  CHECK(h.clientTrace->closeCode == CloseCode::InternalError);
  CHECK(h.upstreamTrace->closeCalls == 1);
}

TEST_CASE("A failed upstream send stops the inbound relay", "[bridge]") {
  Harness h;
  h.upstream->failSendAt(3);
  for (int i = 0; i < 5; ++i)
    h.client->pushMedia("AAEC", "audio/pcm");

  CHECK(h.bridge->run() == BridgeError::SendError);

  CHECK(h.upstreamTrace->sendCalls == 3);
  CHECK(h.upstreamTrace->sent.size() == 2);
  CHECK(h.clientTrace->closeCalls == 1);
  CHECK(h.clientTrace->closeCode == CloseCode::InternalError);
  CHECK(h.upstreamTrace->closeCalls == 1);
}

TEST_CASE("Client disconnect unblocks a pending upstream receive", "[bridge]") {
  Harness h;
  auto result = std::async(std::launch::async, [&h] { return h.bridge->run(); });

  // Nothing queued upstream: the outbound loop is parked in receive().
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  h.client->disconnect();

  REQUIRE(result.wait_for(kWait) == std::future_status::ready);
  CHECK(result.get() == BridgeError::ClientClosed);
  CHECK(h.bridge->state() == SessionBridge::State::Closed);
  CHECK(h.upstreamTrace->cancelCalls == 1);
  CHECK(h.upstreamTrace->closeCalls == 1);
  CHECK(h.clientTrace->closeCalls == 1);
}

TEST_CASE("Malformed client envelopes end the session", "[bridge]") {
  Harness h;
  h.client->pushMedia("AAEC", "audio/pcm");
  h.client->pushMedia("not-base64!", "audio/pcm");
  h.client->pushMedia("AAEC", "audio/pcm");

  CHECK(h.bridge->run() == BridgeError::MalformedEnvelope);
  CHECK(h.upstreamTrace->sent.size() == 1);
  CHECK(h.clientTrace->closeCode == CloseCode::InvalidPayload);
}

TEST_CASE("Unreadable client frames end the session", "[bridge]") {
  Harness h;
  h.client->pushInvalidFrame();

  CHECK(h.bridge->run() == BridgeError::ReadError);
  CHECK(h.upstreamTrace->sendCalls == 0);
  CHECK(h.clientTrace->closeCode == CloseCode::InvalidPayload);
}

TEST_CASE("Upstream signals are mapped for the client", "[bridge]") {
  Harness h;
  h.upstream->pushSignal(SessionSignal::Kind::Interrupted);
  h.upstream->pushSignal(SessionSignal::Kind::GenerationComplete);
  h.upstream->pushSignal(SessionSignal::Kind::TurnBoundary);
  h.upstream->pushAudio({0x00, 0x01, 0x02});
  h.upstream->end();

  CHECK(h.bridge->run() == BridgeError::UpstreamClosed);

  auto &written = h.clientTrace->written;
  REQUIRE(written.size() == 2);
  CHECK(written[0].kind == OutboundEnvelope::Kind::Interrupted);
  CHECK(written[1].kind == OutboundEnvelope::Kind::Audio);
}

TEST_CASE("Upstream errors are reported before closing", "[bridge]") {
  Harness h;
  h.upstream->pushSignal(SessionSignal::Kind::UpstreamError, "quota exhausted");
  h.upstream->pushAudio({0x01});

  CHECK(h.bridge->run() == BridgeError::UpstreamError);

  auto &written = h.clientTrace->written;
  REQUIRE(written.size() == 1);
  CHECK(written[0].kind == OutboundEnvelope::Kind::Error);
  CHECK(written[0].body == "quota exhausted");
  CHECK(h.clientTrace->closeCode == CloseCode::InternalError);
  CHECK(h.clientTrace->closeReason == "quota exhausted");
}

TEST_CASE("Oversized upstream chunks end the session", "[bridge]") {
  BridgeOptions opts;
  opts.maxOutboundPayloadBytes = 4;
  Harness h(opts);
  h.upstream->pushAudio({1, 2, 3, 4});
  h.upstream->pushAudio({1, 2, 3, 4, 5, 6, 7, 8});
  h.upstream->pushAudio({1});

  CHECK(h.bridge->run() == BridgeError::UnencodableChunk);

  auto &written = h.clientTrace->written;
  REQUIRE(written.size() == 2);
  CHECK(written[0].kind == OutboundEnvelope::Kind::Audio);
  CHECK(written[1].kind == OutboundEnvelope::Kind::Error);
  CHECK(h.bridge->chunksToClient() == 1);
}

TEST_CASE("Client write failures end the session", "[bridge]") {
  Harness h;
  h.client->failWrites(IoStatus::Error);
  h.upstream->pushAudio({0x01});

  CHECK(h.bridge->run() == BridgeError::WriteError);
  CHECK(h.clientTrace->written.empty());
  CHECK(h.upstreamTrace->closeCalls == 1);
}

TEST_CASE("External cancel shuts a running session down", "[bridge]") {
  Harness h;
  auto result = std::async(std::launch::async, [&h] { return h.bridge->run(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  h.bridge->cancel(BridgeError::Shutdown);
  // Only the first terminal condition counts.
  h.bridge->cancel(BridgeError::IdleTimeout);

  REQUIRE(result.wait_for(kWait) == std::future_status::ready);
  CHECK(result.get() == BridgeError::Shutdown);
  CHECK(h.bridge->reason() == BridgeError::Shutdown);
  CHECK(h.clientTrace->closeCode == CloseCode::GoingAway);
  CHECK(h.clientTrace->closeCalls == 1);
  CHECK(h.clientTrace->cancelCalls == 1);
  CHECK(h.clientTrace->cancelCode == CloseCode::GoingAway);
  CHECK(h.clientTrace->cancelReason == h.clientTrace->closeReason);
  CHECK(h.upstreamTrace->closeCalls == 1);
}

TEST_CASE("Cancelling before run relays nothing", "[bridge]") {
  Harness h;
  h.client->pushMedia("AAEC", "audio/pcm");
  h.upstream->pushAudio({0x01});
  h.bridge->cancel(BridgeError::Shutdown);

  CHECK(h.bridge->run() == BridgeError::Shutdown);
  CHECK(h.upstreamTrace->sendCalls == 0);
  CHECK(h.clientTrace->written.empty());
  CHECK(h.bridge->state() == SessionBridge::State::Closed);
}

TEST_CASE("Concurrent sessions do not affect each other", "[bridge]") {
  Harness a;
  Harness b;
  auto runA = std::async(std::launch::async, [&a] { return a.bridge->run(); });
  auto runB = std::async(std::launch::async, [&b] { return b.bridge->run(); });

  a.client->disconnect();
  REQUIRE(runA.wait_for(kWait) == std::future_status::ready);
  CHECK(runA.get() == BridgeError::ClientClosed);

  // b is still relaying in both directions.
  CHECK(b.bridge->state() == SessionBridge::State::Active);
  b.client->pushMedia("AAEC", "audio/pcm");
  CHECK(b.upstreamTrace->waitForSends(1, kWait));
  b.upstream->pushAudio({0x01});
  CHECK(b.clientTrace->waitForWrites(1, kWait));

  b.upstream->end();
  REQUIRE(runB.wait_for(kWait) == std::future_status::ready);
  CHECK(runB.get() == BridgeError::UpstreamClosed);

  CHECK(a.upstreamTrace->closeCalls == 1);
  CHECK(a.upstreamTrace->sent.empty());
  CHECK(b.upstreamTrace->closeCalls == 1);
  CHECK(b.upstreamTrace->sent.size() == 1);
}

TEST_CASE("The client leg is cancelled with the close code of the cause", "[bridge]") {
  Harness h;
  auto result = std::async(std::launch::async, [&h] { return h.bridge->run(); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  h.bridge->cancel(BridgeError::IdleTimeout);

  REQUIRE(result.wait_for(kWait) == std::future_status::ready);
  CHECK(result.get() == BridgeError::IdleTimeout);
  CHECK(h.clientTrace->cancelCode == CloseCode::GoingAway);
  CHECK(h.clientTrace->cancelReason == toString(BridgeError::IdleTimeout));
  CHECK(h.clientTrace->closeCode == CloseCode::GoingAway);
}

TEST_CASE("A client that closed first is cancelled without a reason", "[bridge]") {
  Harness h;
  h.client->disconnect();

  CHECK(h.bridge->run() == BridgeError::ClientClosed);
  CHECK(h.clientTrace->cancelCode == CloseCode::Normal);
  CHECK(h.clientTrace->cancelReason.empty());
  CHECK(h.clientTrace->closeReason.empty());
}
