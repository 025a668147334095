#include "AdbMessage.hpp"

namespace adb {
namespace {
inline void putUint32(string* s, uint32_t value) {
  for (int a = 0; a < 4; a++) {
    s->push_back(char((value >> (8 * a)) & 0xff));
  }
}

inline uint32_t getUint32(const char* buf) {
  const unsigned char* b = (const unsigned char*)buf;
  return uint32_t(b[0]) | (uint32_t(b[1]) << 8) | (uint32_t(b[2]) << 16) |
         (uint32_t(b[3]) << 24);
}
}  // namespace

string commandName(MessageCommand command) {
  switch (command) {
    case MessageCommand::SYNC:
      return "SYNC";
    case MessageCommand::CNXN:
      return "CNXN";
    case MessageCommand::AUTH:
      return "AUTH";
    case MessageCommand::OPEN:
      return "OPEN";
    case MessageCommand::OKAY:
      return "OKAY";
    case MessageCommand::CLSE:
      return "CLSE";
    case MessageCommand::WRTE:
      return "WRTE";
    case MessageCommand::STLS:
      return "STLS";
  }
  std::ostringstream ss;
  ss << "0x" << std::hex << uint32_t(command);
  return ss.str();
}

uint32_t AdbMessage::checksum() const {
  uint32_t sum = 0;
  for (unsigned char c : payload) {
    sum += c;
  }
  return sum;
}

string AdbMessage::serialize() const {
  string s;
  s.reserve(HEADER_SIZE + payload.length());
  uint32_t rawCommand = uint32_t(command);
  putUint32(&s, rawCommand);
  putUint32(&s, arg0);
  putUint32(&s, arg1);
  putUint32(&s, uint32_t(payload.length()));
  putUint32(&s, checksum());
  putUint32(&s, rawCommand ^ 0xffffffff);
  s.append(payload);
  return s;
}

AdbMessage AdbMessage::parseHeader(const char* header, uint32_t* length) {
  uint32_t rawCommand = getUint32(header);
  uint32_t magic = getUint32(header + 20);
  if (magic != (rawCommand ^ 0xffffffff)) {
    std::ostringstream ss;
    ss << "Invalid message magic: command 0x" << std::hex << rawCommand
       << " magic 0x" << magic;
    throw ProtocolError(ss.str());
  }
  *length = getUint32(header + 12);
  if (*length > MAX_PAYLOAD) {
    throw ProtocolError(string("Invalid payload size (>1 MB): ") +
                        to_string(*length));
  }
  return AdbMessage(MessageCommand(rawCommand), getUint32(header + 4),
                    getUint32(header + 8));
}
}  // namespace adb
