#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "SessionBridge.h"

// Process-wide table of live sessions. Used for admission control and
// shutdown broadcast only; the relay loops never touch it.
class SessionRegistry {
public:
  // A reserved session slot. Released on destruction unless consumed by
  // registerSession().
  class Ticket {
  public:
    Ticket() = default;
    Ticket(Ticket &&other) noexcept;
    Ticket &operator=(Ticket &&other) noexcept;
    ~Ticket();

    explicit operator bool() const { return registry_ != nullptr; }

  private:
    friend class SessionRegistry;
    explicit Ticket(SessionRegistry *registry) : registry_(registry) {}
    void release();

    SessionRegistry *registry_ = nullptr;
  };

  explicit SessionRegistry(size_t maxSessions);

  // Empty ticket when the registry is full or shutting down.
  Ticket admit();

  // Consumes the ticket. Fails once shutdownAll() has run.
  bool registerSession(Ticket &ticket, std::shared_ptr<SessionBridge> bridge);
  void unregister(const std::string &sessionId);

  // Cancels every registered session and refuses further admissions.
  void shutdownAll();
  bool shuttingDown();

  // Cancels sessions with no activity for longer than idleTimeout.
  size_t reapIdle(std::chrono::milliseconds idleTimeout);

  std::shared_ptr<SessionBridge> find(const std::string &sessionId);
  size_t count();
  size_t maxSessions() const { return maxSessions_; }
  std::vector<std::string> sessionIds();

private:
  void releaseSlot();
  std::vector<std::shared_ptr<SessionBridge>> snapshot();

  std::map<std::string, std::shared_ptr<SessionBridge>> sessions_;
  size_t reserved_ = 0;
  size_t maxSessions_;
  bool shuttingDown_ = false;
  std::mutex mutex_;
};
