#include "StreamProtocol.hpp"

namespace adb {
void acknowledge(MessageChannel* channel, const StreamIds& ids) {
  VLOG(2) << "Acknowledging " << ids;
  channel->writeMessage(
      AdbMessage(MessageCommand::OKAY, ids.localId, ids.remoteId));
}

void sendClose(MessageChannel* channel, const StreamIds& ids) {
  VLOG(1) << "Closing " << ids;
  channel->writeMessage(
      AdbMessage(MessageCommand::CLSE, ids.localId, ids.remoteId));
}

ostream& operator<<(ostream& os, StreamState state) {
  switch (state) {
    case StreamState::OPEN:
      return os << "OPEN";
    case StreamState::AWAITING_FINAL_CLOSE:
      return os << "AWAITING_FINAL_CLOSE";
    case StreamState::CLOSED:
      return os << "CLOSED";
  }
  return os << "UNKNOWN";
}

void StreamLifecycle::onData() {
  if (state == StreamState::CLOSED) {
    throw ProtocolError("Got WRTE on a closed stream");
  }
  state = StreamState::OPEN;
  pendingWrites = true;
}

bool StreamLifecycle::onClose() {
  if (state == StreamState::CLOSED) {
    throw ProtocolError("Got CLSE on a closed stream");
  }
  if (pendingWrites) {
    pendingWrites = false;
    state = StreamState::AWAITING_FINAL_CLOSE;
    return false;
  }
  state = StreamState::CLOSED;
  return true;
}
}  // namespace adb
