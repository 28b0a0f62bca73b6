#include "LogHandler.hpp"

#include "SessionError.hpp"

INITIALIZE_EASYLOGGINGPP

namespace devlink {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // %thread prints the name set with setThreadName
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
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

string LogHandler::apply(el::Configurations *conf,
                         const LogDestination &destination) {
  el::Loggers::setVerboseLevel(destination.verbose);

  string logFile;
  if (destination.silent) {
    conf->setGlobally(el::ConfigurationType::Enabled, "false");
  } else {
    logFile = createLogFile(destination);
    el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
    conf->setGlobally(el::ConfigurationType::Filename, logFile);
    conf->setGlobally(el::ConfigurationType::ToFile, "true");
    conf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                      destination.maxFileSize);
    conf->setGlobally(el::ConfigurationType::ToStandardOutput,
                      destination.toStdout ? "true" : "false");
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
  }
  el::Loggers::reconfigureLogger("default", *conf);
  return logFile;
}

string LogHandler::createLogFile(const LogDestination &destination) {
  char timestamp[80];
  time_t now = time(NULL);
  strftime(timestamp, sizeof(timestamp), "%Y-%m-%d_%H-%M-%S", localtime(&now));
  fs::path logFile = fs::path(destination.directory) /
                     (destination.prefix + "-" + timestamp + "_" +
                      to_string(getpid()) + ".log");

  std::error_code ec;
  fs::create_directories(destination.directory, ec);
  if (ec) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "cannot create log directory " + destination.directory +
                           ": " + ec.message());
  }
  int fd = ::open(logFile.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw SessionError(ErrorKind::CONFIGURATION,
                       "cannot create log file " + logFile.string() + ": " +
                           strerror(errno));
  }
  ::close(fd);
  return logFile.string();
}

void LogHandler::rolloutHandler(const char *filename, std::size_t) {
  // The log file is closed here, so no logging
  remove(filename);
}
}  // namespace devlink
