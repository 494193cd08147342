#ifndef __TT_PSEUDO_TERMINAL__
#define __TT_PSEUDO_TERMINAL__

#include "Headers.hpp"
#include "TerminalGeometry.hpp"

namespace tt {
/**
 * @brief A child process behind a pseudo-terminal master descriptor.
 *
 * `Session` drives exactly one of these from its reader thread; only `start`
 * runs on the spawning (UI) thread.
 */
class PseudoTerminal {
 public:
  virtual ~PseudoTerminal() {}

  /**
   * @brief Creates the child process sized to `geometry`.
   * @returns The non-blocking master descriptor.
   * @throws std::runtime_error if the process could not be created.
   */
  virtual int start(const TerminalGeometry &geometry) = 0;
  /** @brief Returns the descriptor that can be polled for terminal output. */
  virtual int getFd() = 0;
  /** @brief Applies a new window size (TIOCSWINSZ) to the running child. */
  virtual void setGeometry(const TerminalGeometry &geometry) = 0;
  /**
   * @brief Reaps a child whose output already reached EOF.
   * @returns The exit code (128 + signal for signalled children).
   */
  virtual int handleSessionEnd() = 0;
  /**
   * @brief Asks the child to exit, escalating to SIGKILL after `graceMs`.
   * @returns The exit code once the child has been reaped.
   */
  virtual int terminate(int graceMs) = 0;
  /** @brief Releases the master descriptor. */
  virtual void cleanup() = 0;
};

/** @brief Creates the pseudo-terminal behind each new session. */
class PseudoTerminalFactory {
 public:
  virtual ~PseudoTerminalFactory() {}
  virtual shared_ptr<PseudoTerminal> create() = 0;
};
}  // namespace tt

#endif  // __TT_PSEUDO_TERMINAL__
