#ifndef __ADB_LOG_HANDLER__
#define __ADB_LOG_HANDLER__

#include "AdbError.hpp"
#include "Headers.hpp"

namespace adb {
/**
 * @brief easylogging++ setup shared by adbsh and the test runner.
 *
 * Diagnostics go to a log file.  The "stdout" logger carries the few lines
 * meant for the user, since the shell's own output owns stdout.
 */
class LogHandler {
 public:
  /** @return The base configuration; log files are added by setupLogFiles. */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points `defaultConf` at a new file in `directory`, named
   * "<prefix>-<local time>[_<pid>].log".
   * @return The full path of the file.
   * @throws IoError if the directory or the file cannot be created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory, const string &prefix,
                              bool logToStdout, bool appendPid);

  /** @brief Drops a log file that grew past its size limit. */
  static void rolloutHandler(const char *filename, std::size_t size);

  static void setupStdoutLogger();

 protected:
  static string createLogFile(const string &directory,
                              const string &filename);
};
}  // namespace adb
#endif  // __ADB_LOG_HANDLER__
