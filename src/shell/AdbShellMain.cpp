#include <cxxopts.hpp>

#include "DeviceSession.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "ShellIo.hpp"

using namespace adb;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int runSession(const SocketEndpoint& endpoint, const vector<string>& command) {
  DeviceSession session(endpoint);
  try {
    session.connect();
    if (!command.empty()) {
      FdOutputSink output;
      session.shellCommand(command, &output);
    } else {
      RawTerminalMode rawMode;
      rawMode.setup();
      session.shell(shared_ptr<InputSource>(new FdInputSource()),
                    shared_ptr<OutputSink>(new FdOutputSink()));
      rawMode.teardown();
    }
  } catch (const AdbError& ae) {
    LOG(ERROR) << "Session with " << endpoint << " failed: " << ae.what();
    CLOG(INFO, "stdout") << "adbsh: " << ae.what() << endl;
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  string tmpDir = GetTempDirectory();

  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  adb::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, adb::InterruptSignalHandler);

  // A device or terminal that goes away surfaces as EPIPE from write()
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("adbsh", "Shell on an Android device over adb/TCP");
  try {
    options.positional_help("[command...]");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Device host name or address",
         cxxopts::value<std::string>()->default_value("localhost"))  //
        ("p,port", "Device adbd port",
         cxxopts::value<int>()->default_value(to_string(DEFAULT_ADB_PORT)))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"))  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>()->default_value(tmpDir))  //
        ("logtostdout", "Write log to stdout")                  //
        ("command", "Command to run instead of an interactive shell",
         cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"command"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "adbsh version " << ADBSHELL_VERSION << endl;
      exit(0);
    }

    el::Loggers::setVerboseLevel(result["verbose"].as<int>());

    bool logToStdout = result.count("logtostdout") > 0;
    try {
      LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                                "adbsh", logToStdout, true);
    } catch (const IoError& ioe) {
      CLOG(ERROR, "stdout") << "adbsh: " << ioe.what() << endl;
      return 1;
    }

    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("adbsh-main");

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    SocketEndpoint endpoint;
    endpoint.set_name(result["host"].as<string>());
    endpoint.set_port(result["port"].as<int>());

    vector<string> command;
    if (result.count("command")) {
      command = result["command"].as<vector<string>>();
    }

    int rc = runSession(endpoint, command);

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return rc;
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  }
  return 1;
}
