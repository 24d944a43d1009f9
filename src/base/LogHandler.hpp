#ifndef __MCPV_LOG_HANDLER__
#define __MCPV_LOG_HANDLER__

#include "Headers.hpp"

namespace mcpv {
/**
 * @brief Configures easylogging++ for the supervisor and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging inside `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false, bool appendPid = false,
                            string maxlogsize = "20971520");

  /**
   * @brief Creates a fresh private directory under the temp dir, named
   * `<prefix>_XXXXXX`.
   */
  static string createTempLogDirectory(const string &prefix);

  /**
   * @brief Rotation callback: the full log file is deleted.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace mcpv
#endif  // __MCPV_LOG_HANDLER__
