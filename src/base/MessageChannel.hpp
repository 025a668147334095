#ifndef __ADB_MESSAGE_CHANNEL__
#define __ADB_MESSAGE_CHANNEL__

#include "AdbMessage.hpp"
#include "Headers.hpp"

namespace adb {
/**
 * @brief Duplex channel of whole protocol messages over one connection.
 *
 * Handles returned by clone() share the underlying connection.  A message
 * read or written through any handle is never interleaved with another
 * message going the same direction, so one thread may read while another
 * writes.
 */
class MessageChannel {
 public:
  virtual ~MessageChannel() {}

  /**
   * @brief Blocks until the next message arrives.
   * @throws TransportError when the connection fails or closes.
   * @throws ProtocolError when the bytes on the wire are not a valid message.
   */
  virtual AdbMessage readMessage() = 0;

  /**
   * @brief Sends one message.
   * @throws TransportError when the connection fails.
   */
  virtual void writeMessage(const AdbMessage& message) = 0;

  /** @brief Returns an independent handle over the same connection. */
  virtual shared_ptr<MessageChannel> clone() = 0;

  /**
   * @brief Shuts the connection down for every clone.  Reads blocked on it
   * fail with a TransportError.
   */
  virtual void close() = 0;
};
}  // namespace adb

#endif  // __ADB_MESSAGE_CHANNEL__
