#include "WebSocketConnection.h"
#include "../app/Logger.h"
#include "../util/Net.h"
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <boost/beast/http.hpp>
#include <sys/socket.h>

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Close frame reasons are limited to 123 bytes on the wire.
constexpr size_t kMaxCloseReason = 120;

bool isDisconnect(const beast::error_code &ec) {
  return ec == websocket::error::closed || ec == http::error::end_of_stream ||
         ec == net::error::eof || ec == net::error::connection_reset ||
         ec == net::error::connection_aborted || ec == net::error::broken_pipe;
}

} // namespace

WebSocketConnection::WebSocketConnection(int fd, Options opts)
    : work_(net::make_work_guard(ioc_)), ws_(net::make_strand(ioc_)),
      writeTimer_(ws_.get_executor()), opts_(std::move(opts)),
      peer_(Net::peerAddress(fd)),
      closeFuture_(closeDone_.get_future().share()) {
  Net::setNoDelay(fd);

  beast::error_code ec;
  ws_.next_layer().socket().assign(tcp::v4(), fd, ec);
  if (ec) {
    LOG_ERROR("Failed to adopt client socket " << peer_ << ": " << ec.message());
    Net::closeSocket(fd);
  } else {
    adopted_ = true;
  }

  ioThread_ = std::thread([this] { ioc_.run(); });
}

WebSocketConnection::~WebSocketConnection() {
  close(CloseCode::GoingAway, "");
}

template <class T, class Op> T WebSocketConnection::onStrand(Op op) {
  auto done = std::make_shared<std::promise<T>>();
  std::future<T> result = done->get_future();
  net::post(ws_.get_executor(), [op, done]() mutable { op(done); });
  return result.get();
}

void WebSocketConnection::rejectBusy(int fd) {
  static const char kResponse[] = "HTTP/1.1 503 Service Unavailable\r\n"
                                  "Server: live-media-gateway\r\n"
                                  "Retry-After: 1\r\n"
                                  "Content-Length: 0\r\n"
                                  "Connection: close\r\n\r\n";

  // Unread request bytes would turn the close into a reset.
  char discard[1024];
  while (::recv(fd, discard, sizeof(discard), MSG_DONTWAIT) > 0) {
  }

  if (::send(fd, kResponse, sizeof(kResponse) - 1, MSG_NOSIGNAL | MSG_DONTWAIT) < 0) {
    LOG_DEBUG("Failed to send 503 to " << Net::peerAddress(fd));
  }
  Net::shutdownSocket(fd, SHUT_WR);
  Net::closeSocket(fd);
}

bool WebSocketConnection::accept() {
  if (!adopted_)
    return false;

  beast::error_code ec = onStrand<beast::error_code>([this](auto done) {
    ws_.next_layer().expires_after(opts_.handshakeTimeout);
    http::async_read(ws_.next_layer(), handshakeBuffer_, request_,
                     [this, done](beast::error_code ec, std::size_t) {
                       ws_.next_layer().expires_never();
                       done->set_value(ec);
                     });
  });
  if (ec) {
    LOG_WARN("Handshake read from " << peer_ << " failed: " << ec.message());
    return false;
  }

  if (!websocket::is_upgrade(request_)) {
    return rejectHandshake(400, "expected websocket upgrade");
  }

  std::string target(request_.target().data(), request_.target().size());
  std::string path = target.substr(0, target.find('?'));
  if (path != opts_.path) {
    LOG_WARN("Client " << peer_ << " requested unknown path " << path);
    return rejectHandshake(404, "not found");
  }

  ec = onStrand<beast::error_code>([this](auto done) {
    // The closing handshake is bounded by handshake_timeout as well.
    // Idle sessions are reaped by the registry, not by the stream.
    auto timeout =
        websocket::stream_base::timeout::suggested(beast::role_type::server);
    timeout.handshake_timeout = opts_.handshakeTimeout;
    timeout.idle_timeout = websocket::stream_base::none();
    ws_.set_option(timeout);
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type &res) {
          res.set(http::field::server, "live-media-gateway");
        }));
    ws_.read_message_max(opts_.maxMessageBytes);
    ws_.async_accept(request_, [this, done](beast::error_code ec) {
      if (!ec)
        ws_.text(true);
      done->set_value(ec);
    });
  });
  if (ec) {
    LOG_WARN("WebSocket accept from " << peer_ << " failed: " << ec.message());
    return false;
  }

  LOG_INFO("WebSocket client " << peer_ << " connected on " << path);
  return true;
}

bool WebSocketConnection::rejectHandshake(unsigned status,
                                          const std::string &reason) {
  auto res = std::make_shared<http::response<http::string_body>>(
      static_cast<http::status>(status), 11);
  res->set(http::field::server, "live-media-gateway");
  res->set(http::field::content_type, "text/plain");
  res->keep_alive(false);
  res->body() = reason;
  res->prepare_payload();

  beast::error_code ec = onStrand<beast::error_code>([this, res](auto done) {
    ws_.next_layer().expires_after(opts_.writeTimeout);
    http::async_write(ws_.next_layer(), *res,
                      [this, res, done](beast::error_code ec, std::size_t) {
                        ws_.next_layer().expires_never();
                        done->set_value(ec);
                      });
  });
  if (ec) {
    LOG_DEBUG("Failed to send " << status << " to " << peer_ << ": " << ec.message());
  }
  return false;
}

IoStatus WebSocketConnection::readEnvelope(InboundEnvelope &env) {
  if (cancelled_ || closed_ || !adopted_)
    return IoStatus::Closed;

  ReadResult result = onStrand<ReadResult>([this](auto done) {
    if (closeStarted_) {
      ReadResult r;
      r.ec = websocket::error::closed;
      done->set_value(std::move(r));
      return;
    }
    readBuffer_.clear();
    ws_.async_read(readBuffer_, [this, done](beast::error_code ec, std::size_t) {
      ReadResult r;
      r.ec = ec;
      if (!ec) {
        r.text = ws_.got_text();
        r.payload = beast::buffers_to_string(readBuffer_.data());
      }
      done->set_value(std::move(r));
    });
  });

  if (result.ec) {
    if (cancelled_ || isDisconnect(result.ec)) {
      LOG_DEBUG("Client " << peer_ << " read side closed: " << result.ec.message());
      return IoStatus::Closed;
    }
    LOG_WARN("Client " << peer_ << " read failed: " << result.ec.message());
    return IoStatus::Error;
  }

  if (!result.text) {
    LOG_WARN("Client " << peer_ << " sent a binary frame, expected JSON text");
    return IoStatus::Error;
  }

  auto parsed = EnvelopeCodec::parseInbound(result.payload);
  if (!parsed) {
    LOG_WARN("Client " << peer_ << " sent an unrecognised envelope ("
                       << result.payload.size() << " bytes)");
    return IoStatus::Error;
  }

  env = std::move(*parsed);
  return IoStatus::Ok;
}

IoStatus WebSocketConnection::writeEnvelope(const OutboundEnvelope &env) {
  if (closed_ || !adopted_)
    return IoStatus::Closed;

  auto text = std::make_shared<std::string>(EnvelopeCodec::serializeOutbound(env));

  beast::error_code ec = onStrand<beast::error_code>([this, text](auto done) {
    if (closeStarted_ || !ws_.is_open()) {
      done->set_value(websocket::error::closed);
      return;
    }

    uint64_t seq = ++writeSeq_;
    writeInFlight_ = true;
    writeTimedOut_ = false;
    writeTimer_.expires_after(opts_.writeTimeout);
    writeTimer_.async_wait([this, seq](beast::error_code ec) {
      if (!ec)
        onWriteDeadline(seq);
    });

    ws_.async_write(net::buffer(*text),
                    [this, text, done](beast::error_code ec, std::size_t) {
                      writeInFlight_ = false;
                      writeTimer_.cancel();
                      if (writeTimedOut_)
                        ec = net::error::timed_out;
                      done->set_value(ec);
                    });
  });

  if (ec) {
    if (isDisconnect(ec))
      return IoStatus::Closed;
    LOG_WARN("Client " << peer_ << " write failed: " << ec.message());
    return IoStatus::Error;
  }
  return IoStatus::Ok;
}

void WebSocketConnection::onWriteDeadline(uint64_t seq) {
  if (seq != writeSeq_ || !writeInFlight_)
    return;
  writeTimedOut_ = true;
  LOG_WARN("Client " << peer_ << " missed its write deadline, dropping connection");
  // Aborts the pending write and read alike.
  ws_.next_layer().close();
}

void WebSocketConnection::cancel(CloseCode code, const std::string &reason) {
  if (cancelled_.exchange(true))
    return;
  net::post(ws_.get_executor(),
            [this, code, reason] { startClose(code, reason); });
}

void WebSocketConnection::startClose(CloseCode code, const std::string &reason) {
  if (closeStarted_)
    return;
  closeStarted_ = true;

  if (!adopted_ || !ws_.is_open()) {
    closeDone_.set_value();
    return;
  }

  // A pending read completes with websocket::error::closed once the peer
  // echoes the frame. A peer that never does is cut off after
  // handshake_timeout.
  websocket::close_reason cr(static_cast<websocket::close_code>(code),
                             reason.substr(0, kMaxCloseReason));
  ws_.async_close(cr, [this](beast::error_code ec) {
    if (ec && !isDisconnect(ec)) {
      LOG_DEBUG("Close handshake with " << peer_ << " ended: " << ec.message());
    }
    closeDone_.set_value();
  });
}

void WebSocketConnection::close(CloseCode code, const std::string &reason) {
  if (closed_.exchange(true))
    return;
  cancelled_ = true;

  net::post(ws_.get_executor(),
            [this, code, reason] { startClose(code, reason); });

  if (closeFuture_.wait_for(opts_.handshakeTimeout + opts_.writeTimeout) !=
      std::future_status::ready) {
    LOG_WARN("Close handshake with " << peer_ << " did not finish, dropping connection");
  }

  net::post(ws_.get_executor(), [this] { releaseSocket(); });
  if (ioThread_.joinable())
    ioThread_.join();

  LOG_DEBUG("Client " << peer_ << " released (code "
                      << static_cast<uint16_t>(code) << ")");
}

void WebSocketConnection::releaseSocket() {
  writeTimer_.cancel();
  auto &sock = ws_.next_layer().socket();
  if (sock.is_open()) {
    beast::error_code ec;
    sock.shutdown(tcp::socket::shutdown_both, ec);
    sock.close(ec);
  }
  work_.reset();
  ioc_.stop();
}
