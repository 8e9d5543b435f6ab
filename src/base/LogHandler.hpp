#ifndef __RELAY_LOG_HANDLER__
#define __RELAY_LOG_HANDLER__

#include "Headers.hpp"

namespace relay {
/**
 * @brief Configures easylogging++ for the relay server and its tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging from `argc/argv` and returns the default
   * configuration for the caller to customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the configuration at a fresh log file inside @p directory.
   * @param maxLogSize Byte size at which easylogging rolls the file over.
   * @return Full path of the created log file.
   */
  static string setupLogFile(el::Configurations *defaultConf,
                             const string &directory, const string &prefix,
                             bool logToStdout, const string &maxLogSize);

  /**
   * @brief Roll-out callback: deletes the rolled log file.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Configures the "stdout" logger used for operator-facing output.
   */
  static void setupStdoutLogger();

  /**
   * @brief Redirects stderr into a new file in @p directory.
   */
  static void stderrToFile(const string &directory, const string &prefix);

 private:
  static string createLogFile(const string &directory, const string &filename);
  static string timestampedName(const string &prefix, const string &suffix);
};
}  // namespace relay
#endif  // __RELAY_LOG_HANDLER__
