#include "RawSocketUtils.hpp"

namespace adb {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw IoError("Cannot write to fd " + to_string(fd), EBADF);
  }
  size_t done = 0;
  while (done < count) {
    ssize_t rc = ::write(fd, buf + done, count - done);
    if (rc > 0) {
      done += rc;
      continue;
    }
    if (rc == 0) {
      throw IoError("Descriptor accepted no bytes", EPIPE);
    }
    int error = GetErrno();
    if (error == EINTR) {
      continue;
    }
    if (error == EAGAIN || error == EWOULDBLOCK) {
      // stdout may have been left non-blocking by another process
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
      continue;
    }
    VLOG(1) << "write on fd " << fd << " failed: " << strerror(error);
    throw IoError("Cannot write to fd " + to_string(fd), error);
  }
}

void RawSocketUtils::readAll(int fd, char* buf, size_t count) {
  if (fd < 0) {
    throw IoError("Cannot read from fd " + to_string(fd), EBADF);
  }
  size_t done = 0;
  while (done < count) {
    ssize_t rc = ::read(fd, buf + done, count - done);
    if (rc > 0) {
      done += rc;
      continue;
    }
    if (rc == 0) {
      throw IoError("End of stream after " + to_string(done) + " of " +
                        to_string(count) + " bytes",
                    EPIPE);
    }
    int error = GetErrno();
    if (error == EINTR) {
      continue;
    }
    VLOG(1) << "read on fd " << fd << " failed: " << strerror(error);
    throw IoError("Cannot read from fd " + to_string(fd), error);
  }
}
}  // namespace adb
