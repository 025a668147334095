#ifndef __ADB_SOCKET_MESSAGE_CHANNEL__
#define __ADB_SOCKET_MESSAGE_CHANNEL__

#include "Headers.hpp"
#include "MessageChannel.hpp"

namespace adb {
/**
 * @brief MessageChannel that frames messages over a connected, blocking
 * socket.  Takes ownership of the descriptor; it is closed when the last
 * clone goes away.
 */
class SocketMessageChannel : public MessageChannel {
 public:
  explicit SocketMessageChannel(int _socketFd);

  virtual AdbMessage readMessage();
  virtual void writeMessage(const AdbMessage& message);
  virtual shared_ptr<MessageChannel> clone();
  virtual void close();

  int getSocketFd() const { return connection->socketFd; }

 protected:
  struct Connection {
    explicit Connection(int _socketFd) : socketFd(_socketFd) {}
    ~Connection();

    int socketFd;
    /** @brief Held for a whole header+payload read. */
    mutex readMutex;
    /** @brief Held for a whole header+payload write. */
    mutex writeMutex;
  };

  explicit SocketMessageChannel(shared_ptr<Connection> _connection)
      : connection(_connection) {}

  shared_ptr<Connection> connection;
};
}  // namespace adb

#endif  // __ADB_SOCKET_MESSAGE_CHANNEL__
