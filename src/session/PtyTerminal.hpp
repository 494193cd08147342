#ifndef __TT_PTY_TERMINAL__
#define __TT_PTY_TERMINAL__

#include "PseudoTerminal.hpp"
#include "TileTermConfig.hpp"

namespace tt {
/** @brief Runs a shell under `forkpty`. */
class PtyTerminal : public PseudoTerminal {
 public:
  /** How long a child that closed its terminal may keep running before it is
   * hung up on. */
  static const int SESSION_END_GRACE_MS = 500;

  PtyTerminal(const string &_program, const vector<string> &_args);
  virtual ~PtyTerminal();

  virtual int start(const TerminalGeometry &geometry);
  virtual int getFd() { return masterFd; }
  virtual void setGeometry(const TerminalGeometry &geometry);
  virtual int handleSessionEnd();
  virtual int terminate(int graceMs);
  virtual void cleanup();

  pid_t getPid() { return childPid; }

 protected:
  /** @brief Child side of the fork; never returns. */
  void runTerminal();
  int reap(int options);
  /** @brief Polls for the child's exit for up to `ms` milliseconds. */
  bool waitForExit(int ms);

  string program;
  vector<string> args;
  int masterFd;
  pid_t childPid;
  optional<int> exitCode;
};

/** @brief Spawns the configured shell for every new pane. */
class PtyTerminalFactory : public PseudoTerminalFactory {
 public:
  explicit PtyTerminalFactory(const TileTermConfig &config);
  virtual shared_ptr<PseudoTerminal> create();

 protected:
  string shell;
  vector<string> shellArgs;
};
}  // namespace tt

#endif  // __TT_PTY_TERMINAL__
