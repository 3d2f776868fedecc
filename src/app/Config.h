#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "../bridge/SessionBridge.h"
#include "../upstream/UpstreamSession.h"

class Config {
public:
  static Config &instance();
  bool load(const std::string &path);
  bool loadFromNode(const YAML::Node &config);

  UpstreamConfig upstreamConfig() const;
  BridgeOptions bridgeOptions() const;

  std::string bindIp;
  int port;
  std::string wsPath;
  size_t maxSessions;
  std::string logLevel;

  int handshakeTimeoutMs;
  int writeTimeoutMs;
  int idleTimeoutMs;
  size_t maxMessageBytes;
  size_t maxOutboundPayloadBytes;

  std::string upstreamTarget;
  bool upstreamUseTls;
  std::string apiKeyEnv;
  std::string apiKey;
  std::string model;
  std::string systemInstruction;
  std::vector<std::string> responseModalities;
  int connectTimeoutMs;
};
