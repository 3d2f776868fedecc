#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/websocket.hpp>

#include "ClientConnection.h"

// ClientConnection over a Boost.Beast websocket stream on an already
// accepted TCP socket.
//
// Every stream operation runs asynchronously on one strand, driven by a
// private io thread; the blocking methods post the operation and wait for
// its completion. Reads, writes, control frame replies and the closing
// handshake therefore never touch the stream concurrently.
class WebSocketConnection : public ClientConnection {
public:
  struct Options {
    std::string path = "/ws";
    std::chrono::milliseconds handshakeTimeout{5000};
    std::chrono::milliseconds writeTimeout{5000};
    size_t maxMessageBytes = 1024 * 1024;
  };

  // Takes ownership of fd.
  WebSocketConnection(int fd, Options opts);
  ~WebSocketConnection() override;

  WebSocketConnection(const WebSocketConnection &) = delete;
  WebSocketConnection &operator=(const WebSocketConnection &) = delete;

  // Answers a connection that could not be admitted with a bare 503 and
  // closes fd, without spending a thread or a handshake on it.
  static void rejectBusy(int fd);

  // Reads the HTTP upgrade request and completes the websocket handshake.
  // Requests for any other path are answered with 404.
  bool accept();

  IoStatus readEnvelope(InboundEnvelope &env) override;
  IoStatus writeEnvelope(const OutboundEnvelope &env) override;
  void cancel(CloseCode code, const std::string &reason) override;
  void close(CloseCode code, const std::string &reason) override;
  std::string peer() const override { return peer_; }

private:
  using Stream = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  struct ReadResult {
    boost::beast::error_code ec;
    bool text = false;
    std::string payload;
  };

  // Runs op(promise) on the strand and blocks until the promise is set.
  template <class T, class Op> T onStrand(Op op);

  bool rejectHandshake(unsigned status, const std::string &reason);

  // Strand only.
  void startClose(CloseCode code, const std::string &reason);
  void onWriteDeadline(uint64_t seq);
  void releaseSocket();

  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
  Stream ws_;
  boost::asio::steady_timer writeTimer_;
  boost::beast::flat_buffer handshakeBuffer_;
  boost::beast::flat_buffer readBuffer_;
  boost::beast::http::request<boost::beast::http::string_body> request_;
  Options opts_;
  std::string peer_;
  bool adopted_ = false;

  // Strand state.
  uint64_t writeSeq_ = 0;
  bool writeInFlight_ = false;
  bool writeTimedOut_ = false;
  bool closeStarted_ = false;
  std::promise<void> closeDone_;

  std::shared_future<void> closeFuture_;
  std::atomic<bool> cancelled_{false};
  std::atomic<bool> closed_{false};
  std::thread ioThread_;
};
