#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tt {
namespace {
string logTimestamp() {
  time_t now = time(NULL);
  struct tm local;
  localtime_r(&now, &local);
  char buffer[32];
  strftime(buffer, sizeof(buffer), "%Y%m%d-%H%M%S", &local);
  return string(buffer);
}
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from TileTermConfig, not from easylogging's --v flags
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return conf;
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::setupLogFiles(el::Configurations *conf,
                                 const string &directory, const string &prefix,
                                 const string &maxLogSize, bool logToStdout) {
  string filename = prefix + "-" + logTimestamp() + "-" +
                    std::to_string(::getpid()) + ".log";
  string fullPath = createLogFile(directory, filename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  conf->setGlobally(el::ConfigurationType::Filename, fullPath);
  conf->setGlobally(el::ConfigurationType::ToFile, "true");
  conf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                    logToStdout ? "true" : "false");
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  return fullPath;
}

void LogHandler::applyVerbosity(el::Configurations *conf, int verbose,
                                bool silent) {
  el::Loggers::setVerboseLevel(verbose);
  if (silent) {
    conf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  el::Loggers::reconfigureLogger("default", *conf);
}

void LogHandler::nameSessionThread(SessionId id) {
  el::Helpers::setThreadName(string("pane-") + std::to_string(id));
}

void LogHandler::shutdown() { el::Helpers::uninstallPreRollOutCallback(); }

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here: nothing in this function may log.
  string backup = string(filename) + ".1";
  ::remove(backup.c_str());
  if (::rename(filename, backup.c_str()) != 0) {
    ::remove(filename);
  }
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw std::runtime_error(string("Cannot create log directory ") +
                             directory + ": " + ec.message());
  }
  string fullPath = directory + "/" + filename;
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullPath;
}
}  // namespace tt
