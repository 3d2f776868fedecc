#include "EnvelopeCodec.h"
#include "../util/Base64.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

const char *toString(SessionSignal::Kind kind) {
  switch (kind) {
  case SessionSignal::Kind::GenerationComplete:
    return "GenerationComplete";
  case SessionSignal::Kind::TurnBoundary:
    return "TurnBoundary";
  case SessionSignal::Kind::Interrupted:
    return "Interrupted";
  case SessionSignal::Kind::UpstreamError:
    return "UpstreamError";
  }
  return "Unknown";
}

std::optional<InboundEnvelope>
EnvelopeCodec::parseInbound(const std::string &text) {
  json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object())
    return std::nullopt;

  bool hasData = doc.contains("data");
  bool hasText = doc.contains("text");
  if (hasData == hasText)
    return std::nullopt;

  InboundEnvelope env;
  if (hasData) {
    auto data = doc.find("data");
    auto mime = doc.find("mime_type");
    if (!data->is_string() || mime == doc.end() || !mime->is_string())
      return std::nullopt;
    env.kind = InboundEnvelope::Kind::Media;
    env.data = data->get<std::string>();
    env.mimeType = mime->get<std::string>();
  } else {
    auto txt = doc.find("text");
    if (!txt->is_string())
      return std::nullopt;
    env.kind = InboundEnvelope::Kind::Text;
    env.data = txt->get<std::string>();
    env.mimeType = kTextMediaType;
  }
  return env;
}

std::string EnvelopeCodec::serializeOutbound(const OutboundEnvelope &env) {
  json doc;
  switch (env.kind) {
  case OutboundEnvelope::Kind::Audio:
    doc["audio"] = env.body;
    break;
  case OutboundEnvelope::Kind::Text:
    doc["text"] = env.body;
    break;
  case OutboundEnvelope::Kind::Interrupted:
    doc["interrupted"] = true;
    break;
  case OutboundEnvelope::Kind::Error:
    doc["error"] = env.body;
    break;
  }
  // Model text is not guaranteed to be valid UTF-8.
  return doc.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<MediaChunk>
EnvelopeCodec::decodeInbound(const InboundEnvelope &env) {
  if (env.mimeType.empty())
    return std::nullopt;

  if (env.kind == InboundEnvelope::Kind::Text) {
    if (env.data.empty())
      return std::nullopt;
    return MediaChunk(std::vector<uint8_t>(env.data.begin(), env.data.end()),
                      env.mimeType, Direction::Inbound);
  }

  std::vector<uint8_t> payload;
  if (!Base64::decode(env.data, payload))
    return std::nullopt;
  return MediaChunk(std::move(payload), env.mimeType, Direction::Inbound);
}

std::optional<OutboundEnvelope>
EnvelopeCodec::encodeOutbound(const MediaChunk &chunk, size_t maxPayloadBytes) {
  if (chunk.size() > maxPayloadBytes)
    return std::nullopt;

  OutboundEnvelope env;
  if (chunk.isText()) {
    env.kind = OutboundEnvelope::Kind::Text;
    env.body.assign(chunk.payload().begin(), chunk.payload().end());
  } else {
    env.kind = OutboundEnvelope::Kind::Audio;
    env.body = Base64::encode(chunk.payload());
  }
  return env;
}

std::optional<OutboundEnvelope>
EnvelopeCodec::mapSignal(const SessionSignal &signal) {
  if (signal.kind == SessionSignal::Kind::Interrupted) {
    OutboundEnvelope env;
    env.kind = OutboundEnvelope::Kind::Interrupted;
    return env;
  }
  return std::nullopt;
}

OutboundEnvelope EnvelopeCodec::errorEnvelope(const std::string &reason) {
  OutboundEnvelope env;
  env.kind = OutboundEnvelope::Kind::Error;
  env.body = reason;
  return env;
}
