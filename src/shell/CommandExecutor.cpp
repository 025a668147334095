#include "CommandExecutor.hpp"

namespace adb {
CommandExecutor::CommandExecutor(shared_ptr<MessageChannel> _channel,
                                 const StreamIds& _ids)
    : channel(_channel), ids(_ids), bytesReceived(0) {}

void CommandExecutor::run(OutputSink* output) {
  VLOG(1) << "Running command on stream " << ids;
  while (!lifecycle.isClosed()) {
    AdbMessage message = channel->readMessage();
    switch (message.getCommand()) {
      case MessageCommand::WRTE: {
        if (!ids.owns(message)) {
          VLOG(1) << "Ignoring " << message << " for another stream";
          break;
        }
        // The device won't send more until we acknowledge
        acknowledge(channel.get(), ids);
        output->write(message.getPayload());
        bytesReceived += message.getPayload().length();
        lifecycle.onData();
        break;
      }
      case MessageCommand::OKAY:
        break;
      case MessageCommand::CLSE: {
        if (!ids.owns(message)) {
          VLOG(1) << "Ignoring " << message << " for another stream";
          break;
        }
        sendClose(channel.get(), ids);
        if (!lifecycle.onClose()) {
          VLOG(1) << "Got a boundary CLSE on " << ids << ", waiting for more";
        }
        break;
      }
      default:
        LOG(ERROR) << "Unexpected command on " << ids << ": " << message;
        throw ProtocolError("unexpected command: " +
                            commandName(message.getCommand()));
    }
  }
  output->flush();
  LOG(INFO) << "Stream " << ids << " closed after " << bytesReceived
            << " bytes";
}
}  // namespace adb
