#ifndef __BTLINK_LOG_HANDLER__
#define __BTLINK_LOG_HANDLER__

#include "Headers.hpp"

namespace btlink {
/**
 * @brief easylogging++ setup shared by the btlink tool and the test runner.
 *
 * Call setupLogHandler first, adjust the returned configuration (for
 * example with setupLogFiles) and then install it with applyConfiguration.
 */
class LogHandler {
 public:
  /**
   * @brief Starts easylogging and returns the default configuration.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points @p defaultConf at a new file in @p directory named
   * `<prefix>-<timestamp>_<pid>.log`.
   * @param maxLogSize Size in bytes at which the file is rolled out.
   * @return Full path of the log file.
   * @throws std::runtime_error if the directory or file cannot be created.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &directory, const string &prefix,
                              bool logToStdout = false,
                              bool redirectStderrToFile = false,
                              const string &maxLogSize = "20971520");

  /**
   * @brief Installs @p defaultConf on the default logger, names the calling
   * thread and removes rolled out files.
   */
  static void applyConfiguration(const el::Configurations &defaultConf,
                                 const string &threadName);

  /** @brief Deletes a rolled out log file. Must not log. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief The "stdout" logger prints bare messages for console output. */
  static void setupStdoutLogger();

 private:
  static string timestampedName(const string &prefix, const string &tag);
  static string createLogFile(const string &directory, const string &name);
  static void stderrToFile(const string &directory, const string &name);
};
}  // namespace btlink
#endif  // __BTLINK_LOG_HANDLER__
