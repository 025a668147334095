#ifndef __ADB_HEADERS__
#define __ADB_HEADERS__

#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <signal.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <stdint.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "AdbShell.pb.h"
#include "easylogging++.h"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Version advertised in our CNXN message
static const uint32_t A_VERSION = 0x01000000;

// Largest payload we accept from a device and advertise in CNXN
static const uint32_t MAX_PAYLOAD = 1024 * 1024;

// Payload limit for devices that do not tell us theirs
static const uint32_t MAX_PAYLOAD_LEGACY = 4096;

// adbd listens here when "adb tcpip" is enabled
const int DEFAULT_ADB_PORT = 5555;

// Gives up on an unreachable device after this long
const int CONNECT_TIMEOUT_MS = 3000;

// How long the interactive shell waits for its reader thread on exit
const int INBOUND_JOIN_TIMEOUT_MS = 500;

// Chunk size used when pumping local input to the device
const int SHELL_READ_BUFFER_SIZE = 16 * 1024;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef ADBSHELL_VERSION
#define ADBSHELL_VERSION "unknown"
#endif

namespace adb {
inline std::ostream &operator<<(std::ostream &os, const SocketEndpoint &se) {
  return os << (se.has_name() ? se.name() : string("?")) << ":"
            << (se.has_port() ? se.port() : DEFAULT_ADB_PORT);
}

/** @brief Splits on `delim`, keeping empty pieces except a trailing one. */
inline vector<string> split(const string &s, char delim) {
  vector<string> pieces;
  size_t start = 0;
  while (start < s.length()) {
    size_t end = s.find(delim, start);
    if (end == string::npos) {
      end = s.length();
    }
    pieces.push_back(s.substr(start, end - start));
    start = end + 1;
  }
  return pieces;
}

inline string join(const vector<string> &parts, const string &delim) {
  string s;
  for (const auto &part : parts) {
    if (!s.empty() || &part != &parts.front()) {
      s += delim;
    }
    s += part;
  }
  return s;
}

inline string GetTempDirectory() {
  const char *tmpDir = ::getenv("TMPDIR");
  return string(tmpDir && *tmpDir ? tmpDir : "/tmp") + "/";
}

/** @brief Logs a stack trace for exceptions that escape main(). */
inline void HandleTerminate() {
  static std::atomic<bool> installed(false);
  if (installed.exchange(true)) {
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (!eptr) {
      STFATAL << "Terminated without an active exception";
    }
    try {
      std::rethrow_exception(eptr);
    } catch (const std::exception &e) {
      STFATAL << "Uncaught exception: " << e.what();
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl << "adbsh: interrupted" << endl;
  ::exit(signum);
}
}  // namespace adb

#endif  // __ADB_HEADERS__
