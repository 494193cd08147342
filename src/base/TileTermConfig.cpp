#include "TileTermConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace tt {
namespace {
string defaultShell() {
  const char *envShell = ::getenv("SHELL");
  if (envShell && *envShell) {
    return string(envShell);
  }
  return "/bin/sh";
}

bool parseBool(const char *value, bool fallback) {
  if (!value) {
    return fallback;
  }
  string s(value);
  std::transform(s.begin(), s.end(), s.begin(), ::tolower);
  if (s == "1" || s == "true" || s == "yes" || s == "on") {
    return true;
  }
  if (s == "0" || s == "false" || s == "no" || s == "off") {
    return false;
  }
  return fallback;
}
}  // namespace

TileTermConfig::TileTermConfig()
    : shell(defaultShell()),
      loginShell(true),
      width(800),
      height(600),
      cellWidth(8),
      cellHeight(16),
      maxPanes(32),
      dividerThreshold(4),
      minRatio(0.1f),
      maxRatio(0.9f),
      historyLines(10000),
      shutdownGraceMs(500),
      verbose(0),
      silent(false),
      logSize("20971520"),
      logDir(GetTempDirectory() + "tileterm") {}

bool TileTermConfig::loadFile(const string &path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    LOG(WARNING) << "Could not load config file " << path << " (" << rc << ")";
    return false;
  }

  const char *shellValue = ini.GetValue("Shell", "command", NULL);
  if (shellValue && *shellValue) {
    shell = string(shellValue);
  }
  loginShell = parseBool(ini.GetValue("Shell", "login", NULL), loginShell);

  width = float(ini.GetDoubleValue("Window", "width", width));
  height = float(ini.GetDoubleValue("Window", "height", height));
  cellWidth = float(ini.GetDoubleValue("Window", "cell_width", cellWidth));
  cellHeight = float(ini.GetDoubleValue("Window", "cell_height", cellHeight));

  maxPanes = int(ini.GetLongValue("Layout", "max_panes", maxPanes));
  dividerThreshold = float(
      ini.GetDoubleValue("Layout", "divider_threshold", dividerThreshold));
  minRatio = float(ini.GetDoubleValue("Layout", "min_ratio", minRatio));
  maxRatio = float(ini.GetDoubleValue("Layout", "max_ratio", maxRatio));

  historyLines = int(ini.GetLongValue("Session", "history", historyLines));
  shutdownGraceMs =
      int(ini.GetLongValue("Session", "shutdown_grace_ms", shutdownGraceMs));

  verbose = int(ini.GetLongValue("Debug", "verbose", verbose));
  silent = parseBool(ini.GetValue("Debug", "silent", NULL), silent);
  // make sure logsize is a string of int value
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    logSize = string(logsize);
  }
  const char *logdir = ini.GetValue("Debug", "logdir", NULL);
  if (logdir && *logdir) {
    logDir = string(logdir);
  }

  if (cellWidth < 1 || cellHeight < 1) {
    LOG(WARNING) << "Ignoring invalid cell size " << cellWidth << "x"
                 << cellHeight;
    cellWidth = std::max(cellWidth, 1.0f);
    cellHeight = std::max(cellHeight, 1.0f);
  }
  if (maxPanes < 1) {
    maxPanes = 1;
  }
  if (minRatio <= 0 || maxRatio >= 1 || minRatio >= maxRatio) {
    LOG(WARNING) << "Ignoring invalid ratio bounds " << minRatio << "-"
                 << maxRatio;
    minRatio = 0.1f;
    maxRatio = 0.9f;
  }
  return true;
}

void TileTermConfig::applyOverrides(const cxxopts::ParseResult &result) {
  if (result.count("width")) {
    width = result["width"].as<float>();
  }
  if (result.count("height")) {
    height = result["height"].as<float>();
  }
  if (result.count("shell")) {
    shell = result["shell"].as<string>();
  }
  if (result.count("verbose")) {
    verbose = result["verbose"].as<int>();
  }
}

string TileTermConfig::defaultConfigPath() {
  return sago::getConfigHome() + "/tileterm/tileterm.ini";
}

void TileTermConfig::addOptions(cxxopts::Options *options) {
  options->add_options()  //
      ("width", "Viewport width in pixels",
       cxxopts::value<float>())  //
      ("height", "Viewport height in pixels",
       cxxopts::value<float>())  //
      ("shell", "Shell to launch in new panes",
       cxxopts::value<string>())  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"))  //
      ;
}
}  // namespace tt
