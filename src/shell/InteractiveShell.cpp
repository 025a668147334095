#include "InteractiveShell.hpp"

namespace adb {
InteractiveShell::InteractiveShell(shared_ptr<MessageChannel> _channel,
                                   const StreamIds& _ids, uint32_t _maxPayload,
                                   int _joinTimeoutMs)
    : channel(_channel),
      ids(_ids),
      maxPayload(_maxPayload),
      joinTimeoutMs(_joinTimeoutMs),
      messagesSent(0),
      inboundResult(new InboundResult()) {}

InteractiveShell::~InteractiveShell() {
  if (inboundThread && inboundThread->joinable()) {
    LOG(INFO) << "Detaching shell reader for " << ids;
    inboundThread->detach();
  }
}

void InteractiveShell::drainInbound(MessageChannel* channel,
                                    const StreamIds& ids, OutputSink* output,
                                    const std::atomic<bool>* closeSent) {
  while (true) {
    AdbMessage message = channel->readMessage();
    MessageCommand command = message.getCommand();
    if (command == MessageCommand::CLSE && ids.owns(message) && closeSent &&
        closeSent->load()) {
      VLOG(1) << "Device answered our close of " << ids;
      return;
    }
    bool known = (command == MessageCommand::WRTE ||
                  command == MessageCommand::OKAY ||
                  command == MessageCommand::CLSE);
    if (known && !ids.owns(message)) {
      VLOG(1) << "Ignoring " << message << " for another stream";
      continue;
    }
    if (ids.owns(message)) {
      // Acknowledge everything so the device never stalls on us
      acknowledge(channel, ids);
    }
    switch (command) {
      case MessageCommand::WRTE:
        output->write(message.getPayload());
        output->flush();
        break;
      case MessageCommand::OKAY:
        break;
      default:
        throw ShellNotSupportedError("shell not supported: unexpected " +
                                     commandName(command) + " on stream");
    }
  }
}

bool InteractiveShell::isInboundFinished() {
  lock_guard<mutex> guard(inboundResult->resultMutex);
  return inboundResult->finished;
}

std::exception_ptr InteractiveShell::getInboundError() {
  lock_guard<mutex> guard(inboundResult->resultMutex);
  return inboundResult->error;
}

void InteractiveShell::run(shared_ptr<InputSource> input,
                           shared_ptr<OutputSink> output) {
  if (inboundThread) {
    STFATAL << "Tried to run an interactive shell twice on " << ids;
  }
  LOG(INFO) << "Starting interactive shell on " << ids;

  auto inboundChannel = channel->clone();
  auto result = inboundResult;
  auto streamIds = ids;
  inboundThread.reset(
      new std::thread([inboundChannel, streamIds, output, result]() {
        try {
          drainInbound(inboundChannel.get(), streamIds, output.get(),
                       &result->closeSent);
          result->finish(nullptr);
        } catch (const std::exception& e) {
          LOG(WARNING) << "Shell reader for " << streamIds
                       << " stopped: " << e.what();
          result->finish(std::current_exception());
        }
      }));

  StreamWriter writer(channel->clone(), ids, maxPayload);
  try {
    pumpOutbound(input.get(), &writer);
  } catch (const IoError& ioe) {
    messagesSent = writer.getMessagesWritten();
    if (!ioe.isBrokenPipe()) {
      LOG(ERROR) << "Shell session on " << ids << " failed: " << ioe.what();
      stopInbound();
      throw;
    }
    LOG(INFO) << "Broken pipe, ending shell session on " << ids;
  }
  messagesSent = writer.getMessagesWritten();
  closeOutbound();
  stopInbound();
}

void InteractiveShell::closeOutbound() {
  inboundResult->closeSent = true;
  try {
    sendClose(channel.get(), ids);
  } catch (const TransportError& te) {
    LOG(INFO) << "Could not close " << ids << ": " << te.what();
  }
}

void InteractiveShell::pumpOutbound(InputSource* input, StreamWriter* writer) {
  string buf(SHELL_READ_BUFFER_SIZE, '\0');
  while (true) {
    if (isInboundFinished()) {
      LOG(INFO) << "Device side of " << ids << " is gone, stop sending input";
      return;
    }
    if (!input->waitForData(100)) {
      continue;
    }
    ssize_t bytesRead = input->read(&buf[0], buf.length());
    if (bytesRead == 0) {
      LOG(INFO) << "End of input for " << ids;
      return;
    }
    VLOG(3) << "Sending " << bytesRead << " bytes to " << ids;
    writer->write(&buf[0], bytesRead);
  }
}

void InteractiveShell::stopInbound() {
  bool finished;
  {
    unique_lock<mutex> lock(inboundResult->resultMutex);
    finished = inboundResult->finishedCondition.wait_for(
        lock, std::chrono::milliseconds(joinTimeoutMs),
        [this] { return inboundResult->finished; });
  }
  if (finished) {
    inboundThread->join();
    return;
  }
  // The device never answered our close.  The reader ends once the session
  // shuts the socket down.
  LOG(INFO) << "Shell reader for " << ids
            << " still waiting on the device, detaching it";
  inboundThread->detach();
}
}  // namespace adb
