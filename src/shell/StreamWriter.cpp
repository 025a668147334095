#include "StreamWriter.hpp"

namespace adb {
StreamWriter::StreamWriter(shared_ptr<MessageChannel> _channel,
                           const StreamIds& _ids, uint32_t _maxPayload)
    : channel(_channel),
      ids(_ids),
      maxPayload(_maxPayload),
      messagesWritten(0) {
  if (maxPayload == 0) {
    STFATAL << "Invalid max payload for " << ids;
  }
}

void StreamWriter::write(const char* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    size_t chunk = std::min(count - pos, size_t(maxPayload));
    channel->writeMessage(AdbMessage(MessageCommand::WRTE, ids.localId,
                                     ids.remoteId, string(buf + pos, chunk)));
    messagesWritten++;
    pos += chunk;
  }
}
}  // namespace adb
