#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "MediaTypes.h"

// Client -> gateway frame. Media frames carry base64 in `data`; text frames
// carry the raw UTF-8 text in `data` and an implied "text/plain" type.
struct InboundEnvelope {
  enum class Kind { Media, Text };

  Kind kind = Kind::Media;
  std::string data;
  std::string mimeType;
};

// Gateway -> client frame. `body` is base64 audio, model text, or an error
// reason depending on the kind; Interrupted has no body.
struct OutboundEnvelope {
  enum class Kind { Audio, Text, Interrupted, Error };

  Kind kind = Kind::Audio;
  std::string body;
};

class EnvelopeCodec {
public:
  static constexpr const char *kTextMediaType = "text/plain";

  // JSON text -> envelope. Rejects anything that is not one of
  // {"data": str, "mime_type": str} or {"text": str}.
  static std::optional<InboundEnvelope> parseInbound(const std::string &json);
  static std::string serializeOutbound(const OutboundEnvelope &env);

  // nullopt means MalformedEnvelope.
  static std::optional<MediaChunk> decodeInbound(const InboundEnvelope &env);

  // nullopt means UnencodableChunk.
  static std::optional<OutboundEnvelope>
  encodeOutbound(const MediaChunk &chunk, size_t maxPayloadBytes);

  // Fixed signal table. Only Interrupted reaches the client; everything else
  // maps to nullopt and is handled (or dropped) by the caller.
  static std::optional<OutboundEnvelope> mapSignal(const SessionSignal &signal);

  static OutboundEnvelope errorEnvelope(const std::string &reason);
};
