#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace mcpv {
namespace {
// mcpvisor-20261019-153012_4242.log
string logFileName(const string &prefix, bool appendPid) {
  char stamp[32];
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  strftime(stamp, sizeof(stamp), "%Y%m%d-%H%M%S", &local);
  string name = prefix + "-" + stamp;
  if (appendPid) {
    name += "_" + to_string(getpid());
  }
  return name + ".log";
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from our own flags and config, not from --v
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  // %thread prints the names given by setThreadName (mcp-<id> readers)
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool appendPid,
                               string maxlogsize) {
  string fullFname =
      createLogFile(path, logFileName(filenamePrefix, appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
}

string LogHandler::createTempLogDirectory(const string &prefix) {
  string pattern = GetTempDirectory() + prefix + "_XXXXXX";
  if (mkdtemp(&pattern[0]) == NULL) {
    STFATAL << "Cannot create log directory from " << pattern << ": "
            << strerror(GetErrno());
  }
  return pattern;
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // Called with the log file closed: no logging in here
  ::unlink(filename);
}

void LogHandler::setupStdoutLogger() {
  // User-facing output of the CLI: bare messages on stdout only
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << fse.what() << endl;
    exit(1);
  }
  string fullFname = path + "/" + filename;
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}
}  // namespace mcpv
