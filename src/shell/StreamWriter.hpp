#ifndef __ADB_STREAM_WRITER__
#define __ADB_STREAM_WRITER__

#include "Headers.hpp"
#include "MessageChannel.hpp"
#include "StreamProtocol.hpp"

namespace adb {
/**
 * @brief Packs arbitrary bytes into WRTE messages for one stream.
 */
class StreamWriter {
 public:
  StreamWriter(shared_ptr<MessageChannel> _channel, const StreamIds& _ids,
               uint32_t _maxPayload = MAX_PAYLOAD_LEGACY);

  /**
   * @brief Sends `count` bytes as one or more WRTE messages of at most
   * maxPayload bytes each.
   * @throws TransportError when the channel fails.
   */
  void write(const char* buf, size_t count);
  void write(const string& s) { write(s.c_str(), s.length()); }

  /** @brief Number of WRTE messages sent so far. */
  int64_t getMessagesWritten() const { return messagesWritten; }

 protected:
  shared_ptr<MessageChannel> channel;
  StreamIds ids;
  uint32_t maxPayload;
  int64_t messagesWritten;
};
}  // namespace adb

#endif  // __ADB_STREAM_WRITER__
