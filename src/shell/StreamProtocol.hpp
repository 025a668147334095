#ifndef __ADB_STREAM_PROTOCOL__
#define __ADB_STREAM_PROTOCOL__

#include "Headers.hpp"
#include "MessageChannel.hpp"

namespace adb {
/**
 * @brief The id pair of one logical stream on a connection.
 */
struct StreamIds {
  StreamIds() : localId(0), remoteId(0) {}
  StreamIds(uint32_t _localId, uint32_t _remoteId)
      : localId(_localId), remoteId(_remoteId) {}

  /** @brief Chosen by us when the stream was opened. */
  uint32_t localId;
  /** @brief Assigned by the device in its OKAY reply. */
  uint32_t remoteId;

  /** @brief True if the device sent `message` to this stream. */
  bool owns(const AdbMessage& message) const {
    return message.getArg1() == localId && message.getArg0() == remoteId;
  }
};

inline std::ostream& operator<<(std::ostream& os, const StreamIds& ids) {
  return os << "[" << ids.localId << "/" << ids.remoteId << "]";
}

/** @brief Sends the OKAY that lets the device send its next WRTE. */
void acknowledge(MessageChannel* channel, const StreamIds& ids);

/** @brief Sends our CLSE for the stream. */
void sendClose(MessageChannel* channel, const StreamIds& ids);

enum class StreamState {
  /** Open; a CLSE now ends the stream unless data came in since the last one.
   */
  OPEN,
  /** A CLSE arrived right after data and was answered; the next CLSE with no
     data in between ends the stream. */
  AWAITING_FINAL_CLOSE,
  CLOSED,
};

ostream& operator<<(ostream& os, StreamState state);

/**
 * @brief Close negotiation for one stream.
 *
 * The device may send a CLSE as a boundary right after a burst of WRTEs and
 * keep going, so a CLSE only ends the stream when no WRTE was handled since
 * the previous CLSE.
 */
class StreamLifecycle {
 public:
  StreamLifecycle() : state(StreamState::OPEN), pendingWrites(false) {}

  /**
   * @brief Records a WRTE for this stream.
   * @throws ProtocolError if the stream is already closed.
   */
  void onData();

  /**
   * @brief Records a CLSE for this stream (already answered by the caller).
   * @return true when this CLSE ends the stream.
   * @throws ProtocolError if the stream is already closed.
   */
  bool onClose();

  StreamState getState() const { return state; }
  bool hasPendingWrites() const { return pendingWrites; }
  bool isClosed() const { return state == StreamState::CLOSED; }

 protected:
  StreamState state;
  /** @brief A WRTE was handled since the last CLSE. */
  bool pendingWrites;
};
}  // namespace adb

#endif  // __ADB_STREAM_PROTOCOL__
