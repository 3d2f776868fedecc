#include "SessionRegistry.h"
#include "../app/Logger.h"

SessionRegistry::Ticket::Ticket(Ticket &&other) noexcept
    : registry_(other.registry_) {
  other.registry_ = nullptr;
}

SessionRegistry::Ticket &
SessionRegistry::Ticket::operator=(Ticket &&other) noexcept {
  if (this != &other) {
    release();
    registry_ = other.registry_;
    other.registry_ = nullptr;
  }
  return *this;
}

SessionRegistry::Ticket::~Ticket() { release(); }

void SessionRegistry::Ticket::release() {
  if (registry_) {
    registry_->releaseSlot();
    registry_ = nullptr;
  }
}

SessionRegistry::SessionRegistry(size_t maxSessions)
    : maxSessions_(maxSessions) {}

SessionRegistry::Ticket SessionRegistry::admit() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shuttingDown_)
    return Ticket();
  if (sessions_.size() + reserved_ >= maxSessions_)
    return Ticket();
  reserved_++;
  return Ticket(this);
}

void SessionRegistry::releaseSlot() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (reserved_ > 0)
    reserved_--;
}

bool SessionRegistry::registerSession(Ticket &ticket,
                                      std::shared_ptr<SessionBridge> bridge) {
  if (!ticket || ticket.registry_ != this || !bridge)
    return false;

  std::lock_guard<std::mutex> lock(mutex_);
  ticket.registry_ = nullptr;
  if (reserved_ > 0)
    reserved_--;

  if (shuttingDown_)
    return false;
  if (sessions_.find(bridge->id()) != sessions_.end())
    return false;

  sessions_[bridge->id()] = std::move(bridge);
  return true;
}

void SessionRegistry::unregister(const std::string &sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.erase(sessionId);
}

std::vector<std::shared_ptr<SessionBridge>> SessionRegistry::snapshot() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<SessionBridge>> bridges;
  bridges.reserve(sessions_.size());
  for (const auto &pair : sessions_) {
    bridges.push_back(pair.second);
  }
  return bridges;
}

void SessionRegistry::shutdownAll() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shuttingDown_ = true;
  }

  // Copy first: cancelled sessions unregister themselves concurrently.
  auto bridges = snapshot();
  LOG_INFO("Cancelling " << bridges.size() << " active sessions");
  for (auto &bridge : bridges) {
    bridge->cancel(BridgeError::Shutdown);
  }
}

bool SessionRegistry::shuttingDown() {
  std::lock_guard<std::mutex> lock(mutex_);
  return shuttingDown_;
}

size_t SessionRegistry::reapIdle(std::chrono::milliseconds idleTimeout) {
  if (idleTimeout.count() <= 0)
    return 0;

  auto now = std::chrono::steady_clock::now();
  size_t reaped = 0;
  for (auto &bridge : snapshot()) {
    if (bridge->state() != SessionBridge::State::Active)
      continue;
    if (now - bridge->lastActivity() > idleTimeout) {
      SLOG_INFO(bridge->id(), "Idle for more than " << idleTimeout.count()
                                                    << "ms");
      bridge->cancel(BridgeError::IdleTimeout);
      reaped++;
    }
  }
  return reaped;
}

std::shared_ptr<SessionBridge>
SessionRegistry::find(const std::string &sessionId) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(sessionId);
  if (it != sessions_.end())
    return it->second;
  return nullptr;
}

size_t SessionRegistry::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionRegistry::sessionIds() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  for (const auto &pair : sessions_) {
    ids.push_back(pair.first);
  }
  return ids;
}
