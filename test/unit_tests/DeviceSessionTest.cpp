#include "DeviceSession.hpp"

#include "FakeMessageChannel.hpp"
#include "SocketMessageChannel.hpp"
#include "TestHeaders.hpp"

using namespace adb;

namespace {
const string BANNER =
    "device::ro.product.name=sdk_phone64;ro.product.model=Pixel;"
    "ro.product.device=emu64;features=shell_v2,cmd,stat_v2";

// Answers CNXN like adbd does and OPEN with remote id 42.
void deviceResponder(const AdbMessage& message, FakeMessageChannel* channel) {
  switch (message.getCommand()) {
    case MessageCommand::CNXN:
      channel->push(AdbMessage(MessageCommand::CNXN, A_VERSION, 256 * 1024,
                               BANNER + '\0'));
      break;
    case MessageCommand::OPEN:
      channel->push(AdbMessage(MessageCommand::OKAY, 42, message.getArg0()));
      break;
    default:
      break;
  }
}

// Listens on an ephemeral loopback port; returns the fd and fills `port`.
int listenOnLoopback(int* port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  struct sockaddr_in address;
  memset(&address, 0, sizeof(address));
  address.sin_family = AF_INET;
  address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  address.sin_port = 0;
  FATAL_FAIL(::bind(fd, (struct sockaddr*)&address, sizeof(address)));
  FATAL_FAIL(::listen(fd, 1));
  socklen_t length = sizeof(address);
  FATAL_FAIL(::getsockname(fd, (struct sockaddr*)&address, &length));
  *port = ntohs(address.sin_port);
  return fd;
}

SocketEndpoint loopbackEndpoint(int port) {
  SocketEndpoint endpoint;
  endpoint.set_name("127.0.0.1");
  endpoint.set_port(port);
  return endpoint;
}
}  // namespace

TEST_CASE("Banner parsing", "[DeviceSession]") {
  SECTION("Full banner") {
    DeviceInfo info = DeviceSession::parseBanner(BANNER);
    REQUIRE(info.systemtype() == "device");
    REQUIRE(info.serial() == "");
    REQUIRE(info.properties().size() == 3);
    REQUIRE(info.properties().at("ro.product.model") == "Pixel");
    REQUIRE(info.features_size() == 3);
    REQUIRE(info.features(0) == "shell_v2");
    REQUIRE(info.features(2) == "stat_v2");
  }

  SECTION("Trailing separator and junk entries") {
    DeviceInfo info =
        DeviceSession::parseBanner("recovery:0123:a=1;;noequals;b=x=y;");
    REQUIRE(info.systemtype() == "recovery");
    REQUIRE(info.serial() == "0123");
    REQUIRE(info.properties().size() == 2);
    REQUIRE(info.properties().at("b") == "x=y");
    REQUIRE(info.features_size() == 0);
  }

  SECTION("Type only") {
    DeviceInfo info = DeviceSession::parseBanner("bootloader");
    REQUIRE(info.systemtype() == "bootloader");
    REQUIRE_FALSE(info.has_serial());
  }
}

TEST_CASE("Connection handshake", "[DeviceSession]") {
  shared_ptr<FakeMessageChannel> channel(new FakeMessageChannel());
  DeviceSession session(channel);

  SECTION("Device accepts") {
    channel->setResponder(deviceResponder);
    session.connect();

    auto written = channel->getWritten();
    REQUIRE(written.size() == 1);
    REQUIRE(written[0].getCommand() == MessageCommand::CNXN);
    REQUIRE(written[0].getArg0() == A_VERSION);
    REQUIRE(written[0].getArg1() == MAX_PAYLOAD);
    REQUIRE(written[0].getPayload() == string("host::") + '\0');

    REQUIRE(session.getMaxPayload() == 256 * 1024);
    REQUIRE(session.getDeviceInfo().systemtype() == "device");
    REQUIRE(session.getDeviceInfo().maxpayload() == 256 * 1024);
    REQUIRE(session.getDeviceInfo().protocolversion() == A_VERSION);
  }

  SECTION("Device wants authentication") {
    channel->push(AdbMessage(MessageCommand::AUTH, 1, 0, string(20, 't')));
    REQUIRE_THROWS_AS(session.connect(), RequestFailedError);
  }

  SECTION("Device answers nonsense") {
    channel->push(AdbMessage(MessageCommand::WRTE, 1, 2));
    REQUIRE_THROWS_AS(session.connect(), ProtocolError);
  }

  SECTION("Device hangs up") {
    channel->closeInbound();
    REQUIRE_THROWS_AS(session.connect(), TransportError);
  }
}

TEST_CASE("Opening streams", "[DeviceSession]") {
  shared_ptr<FakeMessageChannel> channel(new FakeMessageChannel());
  channel->setResponder(deviceResponder);
  DeviceSession session(channel);
  session.connect();

  SECTION("Accepted") {
    StreamIds ids = session.openStream("shell:ls");
    REQUIRE(ids.localId != 0);
    REQUIRE(ids.remoteId == 42);
    auto opens = channel->getWritten(MessageCommand::OPEN);
    REQUIRE(opens.size() == 1);
    REQUIRE(opens[0].getArg0() == ids.localId);
    REQUIRE(opens[0].getArg1() == 0);
    REQUIRE(opens[0].getPayload() == string("shell:ls") + '\0');
  }

  SECTION("Refused") {
    channel->setResponder(FakeMessageChannel::Responder());
    channel->push(AdbMessage(MessageCommand::CLSE, 0, 1));
    try {
      session.openStream("shell:ls");
      FAIL("openStream() should have thrown");
    } catch (const RequestFailedError& rfe) {
      REQUIRE(string(rfe.what()) == "wrong command CLSE");
    }
  }

  SECTION("One-shot command") {
    // Output, a boundary close, then the final close
    channel->setResponder(
        [](const AdbMessage& message, FakeMessageChannel* fake) {
          if (message.getCommand() != MessageCommand::OPEN) {
            return;
          }
          uint32_t localId = message.getArg0();
          fake->push(AdbMessage(MessageCommand::OKAY, 42, localId));
          fake->push(AdbMessage(MessageCommand::WRTE, 42, localId, "hi\n"));
          fake->push(AdbMessage(MessageCommand::CLSE, 42, localId));
          fake->push(AdbMessage(MessageCommand::CLSE, 42, localId));
        });
    StringOutputSink output;
    session.shellCommand({"echo", "hi"}, &output);
    REQUIRE(output.getBuffer() == "hi\n");
    auto opens = channel->getWritten(MessageCommand::OPEN);
    REQUIRE(opens[0].getPayload() == string("shell:echo hi") + '\0');
    REQUIRE(channel->getWritten(MessageCommand::CLSE).size() == 2);
  }
}

TEST_CASE("Shell command over TCP", "[DeviceSession]") {
  int port;
  int listenFd = listenOnLoopback(&port);

  // Plays adbd on the other end and records what the host sent
  vector<AdbMessage> received;
  std::exception_ptr deviceError;
  std::thread device([listenFd, &received, &deviceError]() {
    try {
      int fd = ::accept(listenFd, NULL, NULL);
      if (fd == -1) {
        throw IoError("accept failed", GetErrno());
      }
      SocketMessageChannel channel(fd);
      AdbMessage cnxn = channel.readMessage();
      received.push_back(cnxn);
      channel.writeMessage(AdbMessage(MessageCommand::CNXN, A_VERSION,
                                      MAX_PAYLOAD, BANNER + '\0'));
      AdbMessage open = channel.readMessage();
      received.push_back(open);
      uint32_t localId = open.getArg0();
      channel.writeMessage(AdbMessage(MessageCommand::OKAY, 42, localId));
      channel.writeMessage(
          AdbMessage(MessageCommand::WRTE, 42, localId, "/system\n"));
      received.push_back(channel.readMessage());
      channel.writeMessage(AdbMessage(MessageCommand::CLSE, 42, localId));
      received.push_back(channel.readMessage());
      channel.writeMessage(AdbMessage(MessageCommand::CLSE, 42, localId));
      received.push_back(channel.readMessage());
    } catch (const std::exception&) {
      deviceError = std::current_exception();
    }
  });

  DeviceSession session(loopbackEndpoint(port));
  session.connect();
  StringOutputSink output;
  session.shellCommand({"ls", "-d", "/system"}, &output);
  device.join();
  session.close();
  ::close(listenFd);

  REQUIRE(deviceError == nullptr);
  REQUIRE(output.getBuffer() == "/system\n");
  REQUIRE(session.getDeviceInfo().features_size() == 3);
  REQUIRE(session.getMaxPayload() == MAX_PAYLOAD);
  REQUIRE(received.size() == 5);
  REQUIRE(received[0].getCommand() == MessageCommand::CNXN);
  REQUIRE(received[1].getPayload() == string("shell:ls -d /system") + '\0');
  REQUIRE(received[2].getCommand() == MessageCommand::OKAY);
  REQUIRE(received[3].getCommand() == MessageCommand::CLSE);
  REQUIRE(received[4].getCommand() == MessageCommand::CLSE);
  REQUIRE(received[4].getArg1() == 42);
}

TEST_CASE("Unreachable device", "[DeviceSession]") {
  // Grab a free port, then stop listening on it
  int port;
  ::close(listenOnLoopback(&port));

  DeviceSession session(loopbackEndpoint(port));
  try {
    session.connect();
    FAIL("connect() should have thrown");
  } catch (const TransportError& te) {
    REQUIRE(te.getErrorNumber() == ECONNREFUSED);
  }
}

TEST_CASE("The session outlives an interactive shell", "[DeviceSession]") {
  shared_ptr<FakeMessageChannel> channel(new FakeMessageChannel());
  DeviceSession session(channel);
  shared_ptr<StringOutputSink> shellOutput(new StringOutputSink());
  shared_ptr<FakeInputSource> input(new FakeInputSource(vector<string>()));

  SECTION("The device answers our close") {
    channel->setResponder(
        [](const AdbMessage& message, FakeMessageChannel* fake) {
          if (message.getCommand() == MessageCommand::CLSE) {
            fake->push(
                AdbMessage(MessageCommand::CLSE, 42, message.getArg0()));
          } else {
            deviceResponder(message, fake);
          }
        });
    session.connect();
    session.shell(input, shellOutput);

    // A one-shot command on the same connection
    channel->setResponder(
        [](const AdbMessage& message, FakeMessageChannel* fake) {
          if (message.getCommand() != MessageCommand::OPEN) {
            return;
          }
          uint32_t localId = message.getArg0();
          fake->push(AdbMessage(MessageCommand::OKAY, 43, localId));
          fake->push(AdbMessage(MessageCommand::WRTE, 43, localId, "ok\n"));
          fake->push(AdbMessage(MessageCommand::CLSE, 43, localId));
          fake->push(AdbMessage(MessageCommand::CLSE, 43, localId));
        });
    StringOutputSink output;
    session.shellCommand({"echo", "ok"}, &output);
    REQUIRE(output.getBuffer() == "ok\n");
    REQUIRE(channel->getWritten(MessageCommand::OPEN).size() == 2);
  }

  SECTION("The device never answers") {
    channel->setResponder(deviceResponder);
    session.connect();
    session.shell(input, shellOutput);

    // The session gave up on the connection instead of hanging
    StringOutputSink output;
    try {
      session.shellCommand({"echo", "ok"}, &output);
      FAIL("shellCommand() should have thrown");
    } catch (const TransportError& te) {
      REQUIRE(te.getErrorNumber() == ENOTCONN);
    }
    REQUIRE(channel->getWritten(MessageCommand::OPEN).size() == 1);
  }
}
