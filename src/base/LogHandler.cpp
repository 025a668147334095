#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace adb {
namespace {
const char *LOG_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
const char *VERBOSE_LOG_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";
const char *MAX_LOG_FILE_SIZE = "20971520";

string logTimestamp() {
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &local);
  return buffer;
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           VERBOSE_LOG_FORMAT);
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  return conf;
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &directory, const string &prefix,
                                 bool logToStdout, bool appendPid) {
  string filename = prefix + "-" + logTimestamp();
  if (appendPid) {
    filename += "_" + to_string(::getpid());
  }
  string path = createLogFile(directory, filename + ".log");

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::Filename, path);
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           MAX_LOG_FILE_SIZE);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
  return path;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed while this runs, so no logging here
  ::remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw IoError("Cannot create log directory " + directory, ec.value());
  }
  string path = directory + "/" + filename;
  int fd = ::open(path.c_str(), O_WRONLY | O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw IoError("Cannot create log file " + path, GetErrno());
  }
  ::close(fd);
  return path;
}
}  // namespace adb
