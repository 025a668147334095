#include "DeviceSession.hpp"

#include "SocketMessageChannel.hpp"
#include "TcpConnector.hpp"

namespace adb {
DeviceSession::DeviceSession(const SocketEndpoint& _endpoint)
    : endpoint(_endpoint), closed(false), maxPayload(MAX_PAYLOAD_LEGACY) {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
}

DeviceSession::DeviceSession(shared_ptr<MessageChannel> _channel)
    : closed(false), channel(_channel), maxPayload(MAX_PAYLOAD_LEGACY) {
  if (sodium_init() == -1) {
    STFATAL << "libsodium init failed";
  }
}

DeviceSession::~DeviceSession() { close(); }

void DeviceSession::connect() {
  if (!channel && !closed) {
    channel.reset(new SocketMessageChannel(TcpConnector::connect(endpoint)));
  }

  auto c = getChannel();
  c->writeMessage(AdbMessage(MessageCommand::CNXN, A_VERSION, MAX_PAYLOAD,
                             string("host::") + '\0'));
  AdbMessage reply = c->readMessage();
  switch (reply.getCommand()) {
    case MessageCommand::CNXN:
      break;
    case MessageCommand::AUTH:
      LOG(ERROR) << "Device " << endpoint << " requires authentication";
      throw RequestFailedError("device requires authentication");
    default:
      throw ProtocolError("expected CNXN, got " +
                          commandName(reply.getCommand()));
  }

  // The banner may or may not carry its terminator
  string banner = reply.getPayload();
  while (!banner.empty() && banner.back() == '\0') {
    banner.pop_back();
  }
  deviceInfo = parseBanner(banner);
  deviceInfo.set_protocolversion(reply.getArg0());
  deviceInfo.set_maxpayload(reply.getArg1());
  if (reply.getArg1() > 0) {
    maxPayload = std::min(reply.getArg1(), MAX_PAYLOAD);
  }
  LOG(INFO) << "Connected to " << deviceInfo.systemtype() << " device, "
            << "protocol version " << std::hex << reply.getArg0() << std::dec
            << ", max payload " << maxPayload << ", "
            << deviceInfo.features_size() << " features";
}

StreamIds DeviceSession::openStream(const string& destination) {
  auto c = getChannel();
  uint32_t localId = 0;
  while (localId == 0) {
    localId = randombytes_random();
  }
  VLOG(1) << "Opening " << destination << " as stream " << localId;
  c->writeMessage(
      AdbMessage(MessageCommand::OPEN, localId, 0, destination + '\0'));

  AdbMessage reply = c->readMessage();
  if (reply.getCommand() != MessageCommand::OKAY ||
      reply.getArg1() != localId) {
    LOG(WARNING) << "Device refused " << destination << ": " << reply;
    throw RequestFailedError("wrong command " +
                             commandName(reply.getCommand()));
  }
  StreamIds ids(localId, reply.getArg0());
  LOG(INFO) << "Opened stream " << ids << " to " << destination;
  return ids;
}

void DeviceSession::shellCommand(const vector<string>& args,
                                 OutputSink* output) {
  StreamIds ids = openStream("shell:" + join(args, " "));
  CommandExecutor executor(getChannel(), ids);
  executor.run(output);
}

void DeviceSession::shell(shared_ptr<InputSource> input,
                          shared_ptr<OutputSink> output) {
  StreamIds ids = openStream("shell:");
  InteractiveShell interactiveShell(getChannel(), ids, maxPayload);
  interactiveShell.run(input, output);
  if (!interactiveShell.isInboundFinished()) {
    LOG(WARNING) << "Device did not close " << ids
                 << ", closing the session";
    close();
  }
}

void DeviceSession::close() {
  if (channel) {
    channel->close();
    channel.reset();
  }
  closed = true;
}

DeviceInfo DeviceSession::parseBanner(const string& banner) {
  DeviceInfo info;
  size_t typeEnd = banner.find(':');
  if (typeEnd == string::npos) {
    info.set_systemtype(banner);
    return info;
  }
  info.set_systemtype(banner.substr(0, typeEnd));
  size_t serialEnd = banner.find(':', typeEnd + 1);
  if (serialEnd == string::npos) {
    info.set_serial(banner.substr(typeEnd + 1));
    return info;
  }
  info.set_serial(banner.substr(typeEnd + 1, serialEnd - typeEnd - 1));

  for (const string& entry : split(banner.substr(serialEnd + 1), ';')) {
    size_t equals = entry.find('=');
    if (entry.empty() || equals == string::npos) {
      continue;
    }
    string key = entry.substr(0, equals);
    string value = entry.substr(equals + 1);
    if (key == "features") {
      for (const string& feature : split(value, ',')) {
        if (!feature.empty()) {
          info.add_features(feature);
        }
      }
    } else {
      (*info.mutable_properties())[key] = value;
    }
  }
  return info;
}

shared_ptr<MessageChannel> DeviceSession::getChannel() {
  if (!channel) {
    throw TransportError("Device session is closed", ENOTCONN);
  }
  return channel;
}
}  // namespace adb
