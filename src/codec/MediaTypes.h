#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

enum class Direction { Inbound, Outbound };

// Result of a blocking leg operation.
enum class IoStatus { Ok, Closed, Error };

// One unit of forwarded media. Read-only once built; ownership moves from
// stage to stage within a single relay loop.
class MediaChunk {
public:
  MediaChunk() = default;
  MediaChunk(std::vector<uint8_t> payload, std::string mediaType,
             Direction direction)
      : payload_(std::move(payload)), mediaType_(std::move(mediaType)),
        direction_(direction) {}

  const std::vector<uint8_t> &payload() const { return payload_; }
  const std::string &mediaType() const { return mediaType_; }
  Direction direction() const { return direction_; }
  size_t size() const { return payload_.size(); }

  bool isText() const { return mediaType_.compare(0, 5, "text/") == 0; }

private:
  std::vector<uint8_t> payload_;
  std::string mediaType_;
  Direction direction_ = Direction::Inbound;
};

// Upstream protocol event that carries no media.
struct SessionSignal {
  enum class Kind { GenerationComplete, TurnBoundary, Interrupted, UpstreamError };

  Kind kind = Kind::TurnBoundary;
  std::string reason;
};

const char *toString(SessionSignal::Kind kind);

using UpstreamEvent = std::variant<SessionSignal, MediaChunk>;
