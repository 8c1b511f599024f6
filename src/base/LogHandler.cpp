#include "LogHandler.hpp"

#include <iomanip>

INITIALIZE_EASYLOGGINGPP

namespace btlink {
namespace {
const char *LOG_FORMAT = "[%level %datetime %thread %fbase:%line] %msg";
// %thread is what the docs call %thread_name
const char *VERBOSE_FORMAT =
    "[%levshort%vlevel %datetime %thread %fbase:%line] %msg";
}  // namespace

el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::Format, LOG_FORMAT);
  conf.set(el::Level::Verbose, el::ConfigurationType::Format, VERBOSE_FORMAT);
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  return conf;
}

string LogHandler::timestampedName(const string &prefix, const string &tag) {
  std::time_t now = std::time(nullptr);
  std::ostringstream ss;
  ss << prefix << tag << "-" << std::put_time(std::localtime(&now), "%Y-%m-%d_%H-%M-%S")
     << "_" << getpid() << ".log";
  return ss.str();
}

string LogHandler::setupLogFiles(el::Configurations *defaultConf,
                                 const string &directory, const string &prefix,
                                 bool logToStdout, bool redirectStderrToFile,
                                 const string &maxLogSize) {
  string logPath = createLogFile(directory, timestampedName(prefix, ""));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  if (redirectStderrToFile) {
    stderrToFile(directory, timestampedName(prefix, "-stderr"));
  }
  return logPath;
}

void LogHandler::applyConfiguration(const el::Configurations &defaultConf,
                                    const string &threadName) {
  el::Loggers::reconfigureLogger("default", defaultConf);
  el::Helpers::setThreadName(threadName);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
}

void LogHandler::rolloutHandler(const char *filename, std::size_t) {
  // The log file is closed at this point
  ::remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Configurations conf;
  conf.setToDefault();
  conf.setGlobally(el::ConfigurationType::Format, "%msg");
  conf.setGlobally(el::ConfigurationType::ToFile, "false");
  conf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  el::Loggers::reconfigureLogger(el::Loggers::getLogger("stdout"), conf);
}

string LogHandler::createLogFile(const string &directory, const string &name) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    throw std::runtime_error("Cannot create log directory " + directory +
                             ": " + ec.message());
  }
  string fullPath = (fs::path(directory) / name).string();
  int fd = ::open(fullPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  if (fd == -1) {
    throw std::runtime_error("Cannot create log file " + fullPath + ": " +
                             strerror(GetErrno()));
  }
  FATAL_FAIL(::close(fd));
  return fullPath;
}

void LogHandler::stderrToFile(const string &directory, const string &name) {
  string fullPath = createLogFile(directory, name);
  FILE *stream = freopen(fullPath.c_str(), "w", stderr);
  if (!stream) {
    STFATAL << "Cannot redirect stderr to " << fullPath;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace btlink
