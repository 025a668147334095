#ifndef __ADB_TCP_CONNECTOR__
#define __ADB_TCP_CONNECTOR__

#include "AdbError.hpp"
#include "Headers.hpp"

namespace adb {
/**
 * @brief Opens the TCP connection to a device's adbd.
 */
class TcpConnector {
 public:
  /**
   * @brief Tries every address `endpoint` resolves to, in order.
   * @return A connected, blocking descriptor with TCP_NODELAY set.
   * @throws TransportError when no address accepts within `timeoutMs`.
   */
  static int connect(const SocketEndpoint& endpoint,
                     int timeoutMs = CONNECT_TIMEOUT_MS);

 protected:
  /** @brief Returns the connected fd, or -1 with errno set. */
  static int connectTo(const struct addrinfo* address, int timeoutMs);
};
}  // namespace adb

#endif  // __ADB_TCP_CONNECTOR__
