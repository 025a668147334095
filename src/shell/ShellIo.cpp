#include "ShellIo.hpp"

namespace adb {
ssize_t FdInputSource::read(char* buf, size_t count) {
  while (true) {
    ssize_t rc = ::read(fd, buf, count);
    if (rc >= 0) {
      return rc;
    }
    auto localErrno = GetErrno();
    if (localErrno == EINTR || localErrno == EAGAIN ||
        localErrno == EWOULDBLOCK) {
      if (localErrno != EINTR) {
        waitForData(100);
      }
      continue;
    }
    throw IoError("Cannot read input", localErrno);
  }
}

bool FdInputSource::waitForData(int timeoutMs) {
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(fd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() == EINTR) {
      return false;
    }
    throw IoError("Cannot wait on input", GetErrno());
  }
  return rc > 0 && FD_ISSET(fd, &rfd);
}
}  // namespace adb
