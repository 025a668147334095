#include "TcpConnector.hpp"

namespace adb {
int TcpConnector::connect(const SocketEndpoint& endpoint, int timeoutMs) {
  string host = endpoint.has_name() ? endpoint.name() : string("localhost");
  string port = to_string(endpoint.has_port() ? endpoint.port()
                                              : DEFAULT_ADB_PORT);

  struct addrinfo hints;
  memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* results = NULL;
  int rc = ::getaddrinfo(host.c_str(), port.c_str(), &hints, &results);
  if (rc != 0) {
    LOG(WARNING) << "Cannot resolve " << endpoint << ": " << gai_strerror(rc);
    throw TransportError("Cannot resolve " + host + ": " + gai_strerror(rc),
                         EHOSTUNREACH);
  }

  int lastErrno = ECONNREFUSED;
  int fd = -1;
  for (struct addrinfo* p = results; p != NULL && fd == -1; p = p->ai_next) {
    fd = connectTo(p, timeoutMs);
    if (fd == -1) {
      lastErrno = GetErrno();
      VLOG(1) << "Connect attempt to " << endpoint
              << " failed: " << strerror(lastErrno);
    }
  }
  ::freeaddrinfo(results);

  if (fd == -1) {
    throw TransportError("Could not connect to " + host + ":" + port,
                         lastErrno);
  }
  LOG(INFO) << "Connected to " << endpoint << " on fd " << fd;
  return fd;
}

int TcpConnector::connectTo(const struct addrinfo* address, int timeoutMs) {
  int fd = ::socket(address->ai_family, address->ai_socktype,
                    address->ai_protocol);
  if (fd == -1) {
    return -1;
  }
  int flags = ::fcntl(fd, F_GETFL, 0);
  int error = 0;
  if (flags == -1 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == -1) {
    error = GetErrno();
  } else if (::connect(fd, address->ai_addr, address->ai_addrlen) == -1) {
    if (GetErrno() != EINPROGRESS) {
      error = GetErrno();
    } else {
      struct pollfd pfd;
      pfd.fd = fd;
      pfd.events = POLLOUT;
      int ready;
      do {
        ready = ::poll(&pfd, 1, timeoutMs);
      } while (ready == -1 && GetErrno() == EINTR);
      if (ready == 0) {
        error = ETIMEDOUT;
      } else if (ready == -1) {
        error = GetErrno();
      } else {
        socklen_t len = sizeof(error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &len) == -1) {
          error = GetErrno();
        }
      }
    }
  }
  if (error == 0 && ::fcntl(fd, F_SETFL, flags) == -1) {
    error = GetErrno();
  }
  if (error != 0) {
    ::close(fd);
    errno = error;
    return -1;
  }

  // Interactive keystrokes go out one WRTE at a time
  int nodelay = 1;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay)) ==
      -1) {
    LOG(WARNING) << "Cannot set TCP_NODELAY: " << strerror(GetErrno());
  }
  return fd;
}
}  // namespace adb
