#ifndef __ADB_INTERACTIVE_SHELL__
#define __ADB_INTERACTIVE_SHELL__

#include "Headers.hpp"
#include "MessageChannel.hpp"
#include "ShellIo.hpp"
#include "StreamProtocol.hpp"
#include "StreamWriter.hpp"

namespace adb {
/**
 * @brief Relays an interactive shell stream in both directions.
 *
 * A reader thread acknowledges and drains everything the device sends into
 * the output sink, while the calling thread pumps the input source to the
 * device.  Both use their own clone of the channel.
 */
class InteractiveShell {
 public:
  InteractiveShell(shared_ptr<MessageChannel> _channel, const StreamIds& _ids,
                   uint32_t _maxPayload = MAX_PAYLOAD_LEGACY,
                   int _joinTimeoutMs = INBOUND_JOIN_TIMEOUT_MS);
  virtual ~InteractiveShell();

  /**
   * @brief Runs until the input ends, the device side goes away, or a write
   * fails.  A broken pipe on the way out counts as a normal end.  After a
   * normal end our CLSE is sent, and the reader stops at the device's answer.
   * @throws IoError/TransportError for any other input or write failure.
   */
  void run(shared_ptr<InputSource> input, shared_ptr<OutputSink> output);

  /**
   * @brief The reader half: acknowledges every message for `ids` and writes
   * WRTE payloads to `output`, flushing each one.
   *
   * Returns normally only for the device's CLSE once `closeSent` is set, i.e.
   * the reply to our own close.  Otherwise it throws: TransportError when the
   * channel fails, ShellNotSupportedError on any command other than
   * WRTE/OKAY.
   */
  static void drainInbound(MessageChannel* channel, const StreamIds& ids,
                           OutputSink* output,
                           const std::atomic<bool>* closeSent = NULL);

  /** @brief True once the reader thread has stopped. */
  bool isInboundFinished();
  /** @brief Why the reader thread stopped, or null while it runs. */
  std::exception_ptr getInboundError();
  /** @brief WRTE messages sent to the device by the last run(). */
  int64_t getMessagesSent() const { return messagesSent; }

 protected:
  /** @brief Where the reader thread leaves its outcome. */
  struct InboundResult {
    InboundResult() : finished(false), closeSent(false) {}

    void finish(std::exception_ptr _error) {
      lock_guard<mutex> guard(resultMutex);
      error = _error;
      finished = true;
      finishedCondition.notify_all();
    }

    mutex resultMutex;
    condition_variable finishedCondition;
    bool finished;
    std::exception_ptr error;
    /** @brief Our CLSE is on its way, so the device's CLSE is the last word. */
    std::atomic<bool> closeSent;
  };

  void pumpOutbound(InputSource* input, StreamWriter* writer);
  /** @brief Tells the device we are done sending. */
  void closeOutbound();
  /** @brief Joins the reader thread, or detaches it after joinTimeoutMs. */
  void stopInbound();

  shared_ptr<MessageChannel> channel;
  StreamIds ids;
  uint32_t maxPayload;
  int joinTimeoutMs;
  int64_t messagesSent;
  shared_ptr<InboundResult> inboundResult;
  shared_ptr<std::thread> inboundThread;
};
}  // namespace adb

#endif  // __ADB_INTERACTIVE_SHELL__
