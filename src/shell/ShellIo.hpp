#ifndef __ADB_SHELL_IO__
#define __ADB_SHELL_IO__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace adb {
/**
 * @brief Destination for bytes coming back from the device.
 */
class OutputSink {
 public:
  virtual ~OutputSink() {}

  /** @brief Appends `s` to the sink. */
  virtual void write(const string& s) = 0;
  /** @brief Pushes anything buffered to its final destination. */
  virtual void flush() {}
};

/**
 * @brief Origin of bytes sent to an interactive shell.
 */
class InputSource {
 public:
  virtual ~InputSource() {}

  /**
   * @brief Reads up to `count` bytes.
   * @return Bytes read; 0 at end of input.
   * @throws IoError when the source fails.
   */
  virtual ssize_t read(char* buf, size_t count) = 0;

  /**
   * @brief Waits up to `timeoutMs` for input.
   * @return true when read() will not block (data or end of input).
   */
  virtual bool waitForData(int timeoutMs) { return true; }
};

/**
 * @brief Writes straight to a descriptor, stdout by default.
 */
class FdOutputSink : public OutputSink {
 public:
  explicit FdOutputSink(int _fd = STDOUT_FILENO) : fd(_fd) {}

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(fd, s.c_str(), s.length());
  }

  int getFd() { return fd; }

 protected:
  int fd;
};

/**
 * @brief Reads from a descriptor, stdin by default.
 */
class FdInputSource : public InputSource {
 public:
  explicit FdInputSource(int _fd = STDIN_FILENO) : fd(_fd) {}

  virtual ssize_t read(char* buf, size_t count);
  virtual bool waitForData(int timeoutMs);

 protected:
  int fd;
};

/**
 * @brief Collects everything into a string, e.g. to capture command output.
 */
class StringOutputSink : public OutputSink {
 public:
  virtual void write(const string& s) {
    lock_guard<mutex> guard(bufferMutex);
    buffer.append(s);
  }

  string getBuffer() {
    lock_guard<mutex> guard(bufferMutex);
    return buffer;
  }

 protected:
  mutex bufferMutex;
  string buffer;
};
/**
 * @brief Puts the controlling terminal into raw mode while an interactive
 * shell runs, so keystrokes reach the device unprocessed.
 */
class RawTerminalMode {
 public:
  explicit RawTerminalMode(int _fd = STDIN_FILENO) : fd(_fd), active(false) {}
  virtual ~RawTerminalMode() { teardown(); }

  /** @brief Does nothing unless `fd` is a terminal. */
  void setup() {
    if (active || !isatty(fd)) {
      return;
    }
    termios terminal_local;
    FATAL_FAIL(tcgetattr(fd, &terminal_local));
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(fd, TCSANOW, &terminal_local));
    active = true;
  }

  /** @brief Restores the terminal state saved by setup(). */
  void teardown() {
    if (!active) {
      return;
    }
    tcsetattr(fd, TCSANOW, &terminal_backup);
    active = false;
  }

 protected:
  int fd;
  bool active;
  termios terminal_backup;
};
}  // namespace adb

#endif  // __ADB_SHELL_IO__
