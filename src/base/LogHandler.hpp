#ifndef __TT_LOG_HANDLER__
#define __TT_LOG_HANDLER__

#include "Headers.hpp"
#include "SessionId.hpp"

namespace tt {
/**
 * @brief Configures easylogging++ for the multiplexer and its tests.
 *
 * Every process has a default logger writing to one file per run and a
 * "stdout" logger that carries command replies and user-facing messages.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes easylogging++ and returns the base configuration.
   *
   * The result is not installed yet; callers adjust it with setupLogFiles()
   * and applyVerbosity() first.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /** @brief Makes the "stdout" logger print bare messages. */
  static void setupStdoutLogger();

  /**
   * @brief Routes the default logger into a new file under `directory`.
   *
   * The file is named `<prefix>-<timestamp>-<pid>.log`. Once it grows past
   * `maxLogSize` bytes it is rotated and the previous file is kept as
   * `<name>.1`.
   * @return the full path of the log file.
   */
  static string setupLogFiles(el::Configurations *conf, const string &directory,
                              const string &prefix, const string &maxLogSize,
                              bool logToStdout);

  /**
   * @brief Applies the verbose level and the silent switch, then installs
   * `conf` on the default logger.
   */
  static void applyVerbosity(el::Configurations *conf, int verbose,
                             bool silent);

  /** @brief Tags log lines from the calling thread with `pane-<id>`. */
  static void nameSessionThread(SessionId id);

  /** @brief Removes the rotation hook before the process exits. */
  static void shutdown();

 private:
  static void rolloutHandler(const char *filename, std::size_t size);

  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace tt
#endif  // __TT_LOG_HANDLER__
