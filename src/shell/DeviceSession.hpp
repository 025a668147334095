#ifndef __ADB_DEVICE_SESSION__
#define __ADB_DEVICE_SESSION__

#include "CommandExecutor.hpp"
#include "Headers.hpp"
#include "InteractiveShell.hpp"
#include "MessageChannel.hpp"
#include "ShellIo.hpp"
#include "StreamProtocol.hpp"

namespace adb {
/**
 * @brief One connection to a device's adbd and the streams opened on it.
 */
class DeviceSession {
 public:
  explicit DeviceSession(const SocketEndpoint& _endpoint);

  /** @brief Runs over an already established channel (used by the tests). */
  explicit DeviceSession(shared_ptr<MessageChannel> _channel);

  virtual ~DeviceSession();

  /**
   * @brief Connects (unless built over a channel) and exchanges CNXN.
   * @throws TransportError if the device cannot be reached.
   * @throws RequestFailedError if the device asks us to authenticate.
   * @throws ProtocolError on any other reply.
   */
  void connect();

  /**
   * @brief Opens a stream to `destination`, e.g. "shell:ls".
   * @throws RequestFailedError unless the device answers with OKAY.
   */
  StreamIds openStream(const string& destination);

  /** @brief Runs `args` joined by spaces and sends what it prints to `output`.
   */
  void shellCommand(const vector<string>& args, OutputSink* output);

  /**
   * @brief Relays an interactive shell between `input` and `output`.  If the
   * device never answers our close, the session is closed too, since its
   * reader still owns the connection.
   */
  void shell(shared_ptr<InputSource> input, shared_ptr<OutputSink> output);

  void close();

  const DeviceInfo& getDeviceInfo() const { return deviceInfo; }
  uint32_t getMaxPayload() const { return maxPayload; }

  /**
   * @brief Parses "<systemtype>:<serial>:<key>=<value>;...", where the
   * "features" key holds a comma separated list.
   */
  static DeviceInfo parseBanner(const string& banner);

 protected:
  /** @throws TransportError once the session is closed. */
  shared_ptr<MessageChannel> getChannel();

  SocketEndpoint endpoint;
  bool closed;
  shared_ptr<MessageChannel> channel;
  DeviceInfo deviceInfo;
  uint32_t maxPayload;
};
}  // namespace adb

#endif  // __ADB_DEVICE_SESSION__
