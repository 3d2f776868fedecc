#pragma once

#include <atomic>

// Turns SIGINT/SIGTERM into a flag polled by the accept loop. SIGPIPE is
// ignored so a client vanishing mid-write surfaces as a write error.
class SignalHandler {
public:
  static void init();
  static bool shouldExit();
  static void setExit();
  static int lastSignal();

private:
  static void handleSignal(int signum);
  static std::atomic<bool> exitFlag_;
  static std::atomic<int> lastSignal_;
};
