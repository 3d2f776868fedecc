#include "Net.h"
#include "../app/Logger.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

int Net::createTcpListener(const std::string &ip, int port, int backlog) {
  int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    LOG_ERROR("Failed to create socket: " << strerror(errno));
    return fd;
  }

  // Enable address reuse
  int opt = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
    LOG_WARN("Failed to set SO_REUSEADDR");
  }

  if (!bindSocket(fd, ip, port)) {
    close(fd);
    return -1;
  }

  if (listen(fd, backlog) < 0) {
    LOG_ERROR("Listen failed on " << ip << ":" << port << " error: " << strerror(errno));
    close(fd);
    return -1;
  }

  if (!setNonBlocking(fd)) {
    close(fd);
    return -1;
  }
  return fd;
}

bool Net::bindSocket(int fd, const std::string &ip, int port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) <= 0) {
    LOG_ERROR("Invalid IP address: " << ip);
    return false;
  }

  if (bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
    LOG_ERROR("Bind failed on " << ip << ":" << port << " error: " << strerror(errno));
    return false;
  }
  return true;
}

bool Net::setNonBlocking(int fd) {
  int flags = fcntl(fd, F_GETFL, 0);
  if (flags == -1) {
    LOG_ERROR("fcntl F_GETFL failed: " << strerror(errno));
    return false;
  }
  if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    LOG_ERROR("fcntl F_SETFL O_NONBLOCK failed: " << strerror(errno));
    return false;
  }
  return true;
}

bool Net::setNoDelay(int fd) {
  int opt = 1;
  if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
    LOG_WARN("Failed to set TCP_NODELAY: " << strerror(errno));
    return false;
  }
  return true;
}

void Net::closeSocket(int fd) {
  if (fd >= 0)
    close(fd);
}

int Net::acceptConnection(int listenFd, int timeoutMs, sockaddr_in &peer) {
  struct pollfd pfd;
  pfd.fd = listenFd;
  pfd.events = POLLIN;

  int ret = ::poll(&pfd, 1, timeoutMs);
  if (ret < 0) {
    if (errno != EINTR) {
      LOG_ERROR("Listener poll error: " << strerror(errno));
    }
    return -1;
  }
  if (ret == 0 || !(pfd.revents & POLLIN))
    return -1;

  socklen_t len = sizeof(peer);
  // Accepted sockets stay blocking; the relay loops rely on blocking I/O.
  int fd = accept4(listenFd, (struct sockaddr *)&peer, &len, SOCK_CLOEXEC);
  if (fd < 0) {
    if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      LOG_WARN("accept failed: " << strerror(errno));
    }
    return -1;
  }
  return fd;
}

void Net::shutdownSocket(int fd, int how) {
  if (fd >= 0)
    ::shutdown(fd, how);
}

std::string Net::ipFromSockAddr(const sockaddr_in &addr) {
  char ip[INET_ADDRSTRLEN];
  inet_ntop(AF_INET, &(addr.sin_addr), ip, INET_ADDRSTRLEN);
  return std::string(ip);
}

int Net::portFromSockAddr(const sockaddr_in &addr) {
  return ntohs(addr.sin_port);
}

std::string Net::peerAddress(int fd) {
  sockaddr_in addr{};
  socklen_t len = sizeof(addr);
  if (getpeername(fd, (struct sockaddr *)&addr, &len) < 0)
    return "unknown";
  return ipFromSockAddr(addr) + ":" + std::to_string(portFromSockAddr(addr));
}
