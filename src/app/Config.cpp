#include "Config.h"
#include "Logger.h"
#include <cstdlib>

Config &Config::instance() {
  static Config instance;
  return instance;
}

bool Config::load(const std::string &path) {
  try {
    return loadFromNode(YAML::LoadFile(path));
  } catch (const std::exception &e) {
    LOG_ERROR("Failed to load config " << path << ": " << e.what());
    return false;
  }
}

bool Config::loadFromNode(const YAML::Node &config) {
  try {
    bindIp = config["bind_ip"].as<std::string>("0.0.0.0");
    port = config["port"].as<int>(8000);
    wsPath = config["ws_path"].as<std::string>("/ws");
    maxSessions = config["max_sessions"].as<size_t>(64);
    logLevel = config["log_level"].as<std::string>("INFO");

    handshakeTimeoutMs = config["handshake_timeout_ms"].as<int>(5000);
    writeTimeoutMs = config["write_timeout_ms"].as<int>(5000);
    idleTimeoutMs = config["idle_timeout_ms"].as<int>(300000);
    maxMessageBytes = config["max_message_bytes"].as<size_t>(1024 * 1024);
    maxOutboundPayloadBytes =
        config["max_outbound_payload_bytes"].as<size_t>(1024 * 1024);

    // Indexing into a missing section throws, so substitute an empty map.
    const YAML::Node upstream = config["upstream"]
                                    ? config["upstream"]
                                    : YAML::Node(YAML::NodeType::Map);
    upstreamTarget = upstream["target"].as<std::string>("localhost:50051");
    upstreamUseTls = upstream["use_tls"].as<bool>(false);
    apiKeyEnv = upstream["api_key_env"].as<std::string>("GEMINI_API_KEY");
    model = upstream["model"].as<std::string>(
        "gemini-2.5-flash-native-audio-preview-12-2025");
    systemInstruction = upstream["system_instruction"].as<std::string>(
        "You are a helpful and friendly AI assistant.");
    responseModalities = {"AUDIO"};
    if (upstream["response_modalities"]) {
      responseModalities =
          upstream["response_modalities"].as<std::vector<std::string>>();
    }
    connectTimeoutMs = upstream["connect_timeout_ms"].as<int>(10000);
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid config: " << e.what());
    return false;
  }

  if (port <= 0 || port > 65535) {
    LOG_ERROR("Invalid config: port " << port << " out of range");
    return false;
  }
  if (wsPath.empty() || wsPath[0] != '/') {
    LOG_ERROR("Invalid config: ws_path must start with '/'");
    return false;
  }
  if (handshakeTimeoutMs <= 0 || writeTimeoutMs <= 0 || connectTimeoutMs <= 0) {
    LOG_ERROR("Invalid config: timeouts must be positive");
    return false;
  }
  if (idleTimeoutMs < 0) {
    LOG_ERROR("Invalid config: idle_timeout_ms must not be negative");
    return false;
  }

  const char *key = std::getenv(apiKeyEnv.c_str());
  apiKey = key ? key : "";
  if (apiKey.empty()) {
    LOG_WARN("Environment variable " << apiKeyEnv
                                     << " is not set, upstream calls carry no API key");
  }

  return true;
}

UpstreamConfig Config::upstreamConfig() const {
  UpstreamConfig cfg;
  cfg.target = upstreamTarget;
  cfg.useTls = upstreamUseTls;
  cfg.apiKey = apiKey;
  cfg.model = model;
  cfg.systemInstruction = systemInstruction;
  cfg.responseModalities = responseModalities;
  cfg.connectTimeout = std::chrono::milliseconds(connectTimeoutMs);
  return cfg;
}

BridgeOptions Config::bridgeOptions() const {
  BridgeOptions opts;
  opts.maxOutboundPayloadBytes = maxOutboundPayloadBytes;
  return opts;
}
