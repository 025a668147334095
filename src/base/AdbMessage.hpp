#ifndef __ADB_ADB_MESSAGE__
#define __ADB_ADB_MESSAGE__

#include "AdbError.hpp"
#include "Headers.hpp"

namespace adb {
/**
 * @brief Command tags carried in the first word of every message header.
 *
 * Values are the four ASCII characters of the name, little endian.  A header
 * may carry a value outside this list; it is kept as-is so that the stream
 * controllers can reject it.
 */
enum class MessageCommand : uint32_t {
  SYNC = 0x434e5953,
  CNXN = 0x4e584e43,
  AUTH = 0x48545541,
  OPEN = 0x4e45504f,
  OKAY = 0x59414b4f,
  CLSE = 0x45534c43,
  WRTE = 0x45545257,
  STLS = 0x534c5453,
};

/** @brief Returns "WRTE", "OKAY", ... or the hex value for unknown tags. */
string commandName(MessageCommand command);

inline std::ostream& operator<<(std::ostream& os, MessageCommand command) {
  return os << commandName(command);
}

/**
 * @brief One protocol message: a 24-byte header plus a payload.
 */
class AdbMessage {
 public:
  /** @brief Size of the serialized header in bytes. */
  static const int HEADER_SIZE = 24;

  /** @brief Constructs an empty OKAY with zero ids. */
  AdbMessage() : command(MessageCommand::OKAY), arg0(0), arg1(0) {}
  AdbMessage(MessageCommand _command, uint32_t _arg0, uint32_t _arg1,
             const string& _payload = "")
      : command(_command), arg0(_arg0), arg1(_arg1), payload(_payload) {}

  MessageCommand getCommand() const { return command; }
  /** @brief By convention the sender's stream id. */
  uint32_t getArg0() const { return arg0; }
  /** @brief By convention the recipient's stream id. */
  uint32_t getArg1() const { return arg1; }
  const string& getPayload() const { return payload; }
  void setPayload(const string& _payload) { payload = _payload; }

  /** @brief Unsigned sum of the payload bytes. */
  uint32_t checksum() const;

  /** @brief Header followed by payload, ready for the wire. */
  string serialize() const;

  /**
   * @brief Decodes a header and returns the declared payload length.
   *
   * The returned message has an empty payload; the caller reads `length`
   * bytes and installs them with setPayload().
   * @throws ProtocolError on a magic mismatch or an oversized payload.
   */
  static AdbMessage parseHeader(const char* header, uint32_t* length);

 protected:
  MessageCommand command;
  uint32_t arg0;
  uint32_t arg1;
  string payload;
};

inline std::ostream& operator<<(std::ostream& os, const AdbMessage& message) {
  return os << message.getCommand() << "(" << message.getArg0() << ", "
            << message.getArg1() << ", " << message.getPayload().length()
            << " bytes)";
}
}  // namespace adb

#endif  // __ADB_ADB_MESSAGE__
