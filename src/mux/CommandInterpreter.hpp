#ifndef __TT_COMMAND_INTERPRETER__
#define __TT_COMMAND_INTERPRETER__

#include "Headers.hpp"
#include "TabManager.hpp"

namespace tt {
/**
 * @brief Line-oriented stand-in for the window's input layer.
 *
 * Each line names one command (`split v`, `focus left`, `drag 400 10 200
 * 10`, ...) that is forwarded to the TabManager with the current viewport.
 * Replies are appended to `output`, one entry per line.
 */
class CommandInterpreter {
 public:
  CommandInterpreter(shared_ptr<TabManager> _manager,
                     shared_ptr<SessionEventQueue> _events,
                     const TileTermConfig &config);

  /**
   * @brief Runs one command line.
   * @return true when the application should exit.
   */
  bool execute(const string &line, vector<string> *output);

  /** @brief Processes session events for up to `ms` milliseconds.
   * @return true when the last pane exited. */
  bool waitForEvents(int ms);

  /** @brief Expands `\n`, `\r`, `\t`, `\e` and `\\` in typed input. */
  static string unescape(const string &text);

  inline float getViewportWidth() const { return viewportWidth; }
  inline float getViewportHeight() const { return viewportHeight; }

 protected:
  bool processEvents();
  TerminalGeometry newPaneGeometry() const;
  void describeLayouts(vector<string> *output) const;
  void describeDividers(vector<string> *output) const;
  void describeTabs(vector<string> *output) const;
  void describeScreen(vector<string> *output) const;

  shared_ptr<TabManager> manager;
  shared_ptr<SessionEventQueue> events;
  float viewportWidth;
  float viewportHeight;
  float cellWidth;
  float cellHeight;
};
}  // namespace tt

#endif  // __TT_COMMAND_INTERPRETER__
