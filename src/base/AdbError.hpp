#ifndef __ADB_ERROR__
#define __ADB_ERROR__

#include "Headers.hpp"

namespace adb {
/**
 * @brief Base class for every failure reported by the adb client.
 */
class AdbError : public std::runtime_error {
 public:
  explicit AdbError(const string& what) : std::runtime_error(what) {}
};

/**
 * @brief The peer sent something the protocol does not allow at this point.
 */
class ProtocolError : public AdbError {
 public:
  explicit ProtocolError(const string& what) : AdbError(what) {}
};

/**
 * @brief The reader half of an interactive shell got a command other than
 * WRTE/OKAY.
 */
class ShellNotSupportedError : public ProtocolError {
 public:
  explicit ShellNotSupportedError(const string& what) : ProtocolError(what) {}
};

/**
 * @brief A read or write on a file descriptor failed.
 */
class IoError : public AdbError {
 public:
  IoError(const string& what, int _errorNumber)
      : AdbError(what + ": " + strerror(_errorNumber)),
        errorNumber(_errorNumber) {}

  int getErrorNumber() const { return errorNumber; }

  /** @brief True when the other end of the pipe/socket went away. */
  bool isBrokenPipe() const { return errorNumber == EPIPE; }

 protected:
  int errorNumber;
};

/**
 * @brief A read or write on the device connection failed.
 */
class TransportError : public IoError {
 public:
  TransportError(const string& what, int _errorNumber)
      : IoError(what, _errorNumber) {}
};

/**
 * @brief The device refused a connection or stream request.
 */
class RequestFailedError : public AdbError {
 public:
  explicit RequestFailedError(const string& what) : AdbError(what) {}
};
}  // namespace adb

#endif  // __ADB_ERROR__
