#ifndef __ADB_COMMAND_EXECUTOR__
#define __ADB_COMMAND_EXECUTOR__

#include "Headers.hpp"
#include "MessageChannel.hpp"
#include "ShellIo.hpp"
#include "StreamProtocol.hpp"

namespace adb {
/**
 * @brief Drives one stream running a one-shot command until the device closes
 * it, forwarding everything the command prints to an OutputSink.
 *
 * Every WRTE for the stream is acknowledged before its payload is written to
 * the sink.  Messages for other streams on the same connection are ignored.
 */
class CommandExecutor {
 public:
  CommandExecutor(shared_ptr<MessageChannel> _channel, const StreamIds& _ids);

  /**
   * @brief Blocks until the close handshake completes.
   * @throws ProtocolError on a command other than WRTE/OKAY/CLSE.
   * @throws TransportError when the channel fails.
   */
  void run(OutputSink* output);

  const StreamLifecycle& getLifecycle() const { return lifecycle; }
  int64_t getBytesReceived() const { return bytesReceived; }

 protected:
  shared_ptr<MessageChannel> channel;
  StreamIds ids;
  StreamLifecycle lifecycle;
  int64_t bytesReceived;
};
}  // namespace adb

#endif  // __ADB_COMMAND_EXECUTOR__
