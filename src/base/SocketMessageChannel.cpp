#include "SocketMessageChannel.hpp"

#include "RawSocketUtils.hpp"

namespace adb {
SocketMessageChannel::Connection::~Connection() {
  if (::close(socketFd) == -1) {
    LOG(WARNING) << "Error closing fd " << socketFd << ": "
                 << strerror(GetErrno());
  }
}

SocketMessageChannel::SocketMessageChannel(int _socketFd)
    : connection(new Connection(_socketFd)) {}

AdbMessage SocketMessageChannel::readMessage() {
  lock_guard<mutex> guard(connection->readMutex);
  try {
    char header[AdbMessage::HEADER_SIZE];
    RawSocketUtils::readAll(connection->socketFd, header,
                            AdbMessage::HEADER_SIZE);
    uint32_t length;
    AdbMessage message = AdbMessage::parseHeader(header, &length);
    if (length > 0) {
      string payload(length, '\0');
      RawSocketUtils::readAll(connection->socketFd, &payload[0], length);
      message.setPayload(payload);
    }
    VLOG(3) << "Read " << message << " from fd " << connection->socketFd;
    return message;
  } catch (const IoError& ioe) {
    throw TransportError("Device read failed", ioe.getErrorNumber());
  }
}

void SocketMessageChannel::writeMessage(const AdbMessage& message) {
  string s = message.serialize();
  lock_guard<mutex> guard(connection->writeMutex);
  VLOG(3) << "Writing " << message << " to fd " << connection->socketFd;
  try {
    RawSocketUtils::writeAll(connection->socketFd, &s[0], s.length());
  } catch (const IoError& ioe) {
    throw TransportError("Device write failed", ioe.getErrorNumber());
  }
}

shared_ptr<MessageChannel> SocketMessageChannel::clone() {
  return shared_ptr<MessageChannel>(new SocketMessageChannel(connection));
}

void SocketMessageChannel::close() {
  // Wakes any reader blocked on this socket; the fd itself stays valid until
  // the last clone is gone
  if (::shutdown(connection->socketFd, SHUT_RDWR) == -1 &&
      GetErrno() != ENOTCONN) {
    LOG(WARNING) << "Error shutting down fd " << connection->socketFd << ": "
                 << strerror(GetErrno());
  }
}
}  // namespace adb
