#pragma once

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "UpstreamSession.h"
#include "live.grpc.pb.h"
#include "live.pb.h"
#include <grpcpp/grpcpp.h>

// UpstreamSession over the LiveInference bidirectional gRPC stream.
class GrpcLiveSession : public UpstreamSession {
public:
  using Stream = grpc::ClientReaderWriter<live::ClientMessage, live::ServerMessage>;

  GrpcLiveSession(std::string sessionId, std::shared_ptr<grpc::Channel> channel);
  ~GrpcLiveSession() override;

  // Starts the stream and performs the setup exchange. On failure returns
  // false and fills error; the session must then be discarded.
  bool handshake(const UpstreamConfig &config, std::string &error);

  IoStatus send(const MediaChunk &chunk) override;
  IoStatus receive(UpstreamEvent &event) override;
  void cancel() override;
  void close() override;

  // Flattens one server message into chunks and signals in wire order:
  // content parts first, then interrupted, generation_complete and
  // turn_complete. Setup acknowledgements produce nothing.
  static void unpack(const live::ServerMessage &msg,
                     std::deque<UpstreamEvent> &out);

  static live::ClientMessage buildSetup(const UpstreamConfig &config,
                                        const std::string &sessionId);
  static live::ClientMessage buildInput(const MediaChunk &chunk);

private:
  // Finishes a call that failed during setup and describes why.
  std::string setupFailure(const std::string &what);

  std::string sessionId_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<live::LiveInference::Stub> stub_;
  std::unique_ptr<grpc::ClientContext> context_;
  std::unique_ptr<Stream> stream_;

  // Only touched by the receiving thread.
  std::deque<UpstreamEvent> pending_;

  std::atomic<bool> cancelled_{false};
  std::atomic<bool> closed_{false};
  std::mutex closeMutex_;
};

class GrpcLiveConnector : public UpstreamConnector {
public:
  ConnectResult open(const UpstreamConfig &config,
                     const std::string &sessionId) override;
};
