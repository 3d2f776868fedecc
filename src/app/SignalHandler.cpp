#include "SignalHandler.h"
#include <csignal>
#include <cstring>

std::atomic<bool> SignalHandler::exitFlag_(false);
std::atomic<int> SignalHandler::lastSignal_(0);

void SignalHandler::init() {
  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = handleSignal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  std::signal(SIGPIPE, SIG_IGN);
}

bool SignalHandler::shouldExit() { return exitFlag_; }

int SignalHandler::lastSignal() { return lastSignal_; }

// Only async-signal-safe work here; the main loop logs the signal.
void SignalHandler::handleSignal(int signum) {
  lastSignal_ = signum;
  setExit();
}

void SignalHandler::setExit() { exitFlag_ = true; }
