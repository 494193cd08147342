#ifndef __TT_TILETERM_CONFIG__
#define __TT_TILETERM_CONFIG__

#include <cxxopts.hpp>

#include "Headers.hpp"

namespace tt {
/**
 * @brief Runtime settings read from the ini file and the command line.
 *
 * Precedence is command line, then config file, then the defaults set by the
 * constructor.
 */
class TileTermConfig {
 public:
  TileTermConfig();

  /**
   * @brief Loads settings from an ini file.
   * @return false when the file is missing or cannot be parsed; the current
   * values are left untouched in that case.
   */
  bool loadFile(const string &path);

  /** @brief Applies any options the user passed explicitly on the command line.
   */
  void applyOverrides(const cxxopts::ParseResult &result);

  /** @brief `<config home>/tileterm/tileterm.ini` for the current user. */
  static string defaultConfigPath();

  /** @brief Registers the options understood by `applyOverrides`. */
  static void addOptions(cxxopts::Options *options);

  // [Shell]
  string shell;
  bool loginShell;

  // [Window]
  float width;
  float height;
  float cellWidth;
  float cellHeight;

  // [Layout]
  int maxPanes;
  float dividerThreshold;
  float minRatio;
  float maxRatio;

  // [Session]
  int historyLines;
  int shutdownGraceMs;

  // [Debug]
  int verbose;
  bool silent;
  string logSize;
  string logDir;
};
}  // namespace tt

#endif  // __TT_TILETERM_CONFIG__
