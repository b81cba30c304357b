#ifndef __TV_LOG_HANDLER__
#define __TV_LOG_HANDLER__

#include "Headers.hpp"

namespace tv {
/**
 * @brief Configures easylogging++ for the panel and its driver binaries.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a new `<prefix>-<time>_<pid>.log`
   * file under `path`, creating the directory if needed.
   * @return The full path of the created log file.
   */
  static string setupLogFiles(el::Configurations *defaultConf,
                              const string &path, const string &filenamePrefix,
                              bool logToStdout, const string &maxLogSize);

  /** @brief Deletes a log file that easylogging rolled over. */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief Reconfigures the "stdout" logger so it just writes messages. */
  static void setupStdoutLogger();
};
}  // namespace tv
#endif  // __TV_LOG_HANDLER__
