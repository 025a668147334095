#ifndef __ADB_RAW_SOCKET_UTILS__
#define __ADB_RAW_SOCKET_UTILS__

#include "AdbError.hpp"
#include "Headers.hpp"

namespace adb {
/**
 * @brief Whole-buffer read/write loops on blocking descriptors: the device
 * socket, stdin, stdout and pipes.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on EAGAIN.
   * @throws IoError with the errno of the failed write.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads exactly `count` bytes, blocking until they arrive.
   * @throws IoError when the descriptor fails, or EPIPE when it closes early.
   */
  static void readAll(int fd, char* buf, size_t count);
};
}  // namespace adb
#endif  // __ADB_RAW_SOCKET_UTILS__
