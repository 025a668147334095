#include "LogHandler.hpp"

#include "TestHeaders.hpp"

using namespace adb;

namespace {
bool endsWith(const string& s, const string& suffix) {
  return s.length() >= suffix.length() &&
         s.compare(s.length() - suffix.length(), suffix.length(), suffix) == 0;
}
}  // namespace

TEST_CASE("Log files", "[LogHandler]") {
  string pattern = GetTempDirectory() + string("adbshell_log_XXXXXXXX");
  string directory = string(mkdtemp(&pattern[0])) + "/nested";
  el::Configurations conf;
  conf.setToDefault();
  string pidSuffix = "_" + to_string(::getpid()) + ".log";

  SECTION("With the pid") {
    string path =
        LogHandler::setupLogFiles(&conf, directory, "adbsh", false, true);
    REQUIRE(fs::exists(path));
    REQUIRE(endsWith(path, pidSuffix));
    REQUIRE(path.find(directory + "/adbsh-") == 0);
    REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::Filename)
                ->value() == path);
    REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::ToStandardOutput)
                ->value() == "false");
  }

  SECTION("Without the pid, mirrored to stdout") {
    string path =
        LogHandler::setupLogFiles(&conf, directory, "adbsh", true, false);
    REQUIRE(fs::exists(path));
    REQUIRE(endsWith(path, ".log"));
    REQUIRE_FALSE(endsWith(path, pidSuffix));
    REQUIRE(conf.get(el::Level::Global, el::ConfigurationType::ToStandardOutput)
                ->value() == "true");
  }

  SECTION("Unusable directory") {
    string file = directory + "-file";
    fs::create_directories(directory);
    FATAL_FAIL(::close(::open(file.c_str(), O_WRONLY | O_CREAT, 0600)));
    REQUIRE_THROWS_AS(
        LogHandler::setupLogFiles(&conf, file + "/logs", "adbsh", false, true),
        IoError);
  }

  fs::remove_all(fs::path(directory).parent_path());
}
