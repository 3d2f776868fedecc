#pragma once

#include <netinet/in.h>
#include <string>

class Net {
public:
  static int createTcpListener(const std::string &ip, int port, int backlog = 128);
  static bool bindSocket(int fd, const std::string &ip, int port);
  static bool setNonBlocking(int fd);
  static bool setNoDelay(int fd);
  static void closeSocket(int fd);

  // Waits up to timeoutMs for a pending connection. Returns the accepted fd,
  // or -1 on timeout/error.
  static int acceptConnection(int listenFd, int timeoutMs, sockaddr_in &peer);

  // Shuts one or both directions of fd down without releasing the descriptor.
  static void shutdownSocket(int fd, int how);

  // address helper
  static std::string ipFromSockAddr(const sockaddr_in &addr);
  static int portFromSockAddr(const sockaddr_in &addr);
  static std::string peerAddress(int fd);
};
