#ifndef __TT_TAB_MANAGER__
#define __TT_TAB_MANAGER__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PaneGeometry.hpp"
#include "PseudoTerminal.hpp"
#include "SessionEvents.hpp"
#include "Tab.hpp"
#include "TileTermConfig.hpp"

namespace tt {
/**
 * @brief Ordered tabs of split panes and the command surface the input layer
 * drives.
 *
 * Every command runs synchronously on the UI thread.  Sessions are spawned
 * before they are linked into a tree, so a failed spawn leaves both the tree
 * and the session map untouched.
 */
class TabManager {
 public:
  /** @brief Creates the manager with one tab sized to the configured window.
   */
  TabManager(const TileTermConfig &config,
             shared_ptr<PseudoTerminalFactory> _factory,
             shared_ptr<SessionEventQueue> _events);
  ~TabManager();

  /** @brief Opens a tab with one fresh session and makes it active.
   * @return The index of the new tab. */
  int addTab(const TerminalGeometry &geometry);

  /**
   * @brief Closes the active tab and every session in it.
   * @return true when it was the last tab; its sessions are signalled but the
   * tab stays so there is never zero tabs.
   */
  bool closeActiveTab();

  /** @brief Closes the active pane, falling through to the tab when it was
   * the last pane. The panes left in the tab are resized to their new
   * rectangles. @return true when the application should exit. */
  bool closeActivePane(float viewportWidth, float viewportHeight,
                       float cellWidth, float cellHeight);

  /**
   * @brief Closes the pane showing `id` in whichever tab owns it.
   * @return true when the application should exit.  Unknown ids are ignored.
   */
  bool closePaneById(SessionId id);

  void nextTab();
  void prevTab();
  /** @brief Activates tab `index` (0-based); out of range is ignored. */
  bool gotoTab(int index);

  /**
   * @brief Splits the active pane, spawning its session sized to `geometry`,
   * then resizes every pane in the tab to its new rectangle.
   * @return false when the tab already holds the maximum number of panes.
   * @throws std::runtime_error when the session could not be spawned.
   */
  bool splitActive(SplitAxis axis, const TerminalGeometry &geometry,
                   float viewportWidth, float viewportHeight);

  /** @brief Zooms or unzooms the active pane and resizes the tab to match. */
  void toggleZoom(float viewportWidth, float viewportHeight, float cellWidth,
                  float cellHeight);
  void focusNextPane();
  void focusPrevPane();
  bool focusPane(SessionId id);
  /** @brief Moves focus to the nearest pane in `direction`, if any. */
  bool focusDirection(FocusDirection direction, float viewportWidth,
                      float viewportHeight);
  /** @brief Focuses the pane under (x, y), as a mouse click does. */
  bool focusPaneAt(float x, float y, float viewportWidth,
                   float viewportHeight);

  bool setSplitRatio(const DividerPath &path, float ratio);

  /** @brief Starts dragging the divider under (x, y), if there is one. */
  bool beginDividerDrag(float x, float y, float viewportWidth,
                        float viewportHeight);
  /**
   * @brief Moves the dragged divider to the cursor and resizes the active
   * tab's panes.
   * @return false when no drag is active or the divider went stale.
   */
  bool updateDividerDrag(float x, float y, float viewportWidth,
                         float viewportHeight, float cellWidth,
                         float cellHeight);
  void endDividerDrag();
  inline bool isDragging() const { return bool(drag); }

  /** @brief Recomputes every tab's layout and resizes each session to its
   * own rectangle. */
  void resizeAll(float viewportWidth, float viewportHeight, float cellWidth,
                 float cellHeight);
  void resizeActiveTab(float viewportWidth, float viewportHeight,
                       float cellWidth, float cellHeight);

  /** @brief Renames the tab that owns `id`. @return false for unknown ids. */
  bool setTabTitleBySession(SessionId id, const string &title);

  /** @brief Queues bytes for the active session. */
  void sendInput(const string &bytes);

  /**
   * @brief Drains the session event queue, closing panes whose process
   * exited and resizing the survivors.
   * @return true when the last pane closed and the application should exit.
   */
  bool processEvents(float viewportWidth, float viewportHeight,
                     float cellWidth, float cellHeight);

  inline int count() const { return int(tabs.size()); }
  inline int activeIndex() const { return active; }
  inline Tab *activeTab() const { return tabs[active].get(); }
  inline const vector<unique_ptr<Tab>> &getTabs() const { return tabs; }
  SessionId activeSessionId() const;
  Session *activeSession() const;
  vector<PaneLayout> activeLayouts(float viewportWidth,
                                   float viewportHeight) const;
  vector<DividerInfo> activeDividers(float viewportWidth,
                                     float viewportHeight) const;

  json toJson() const;

 protected:
  unique_ptr<Session> spawnSession(const TerminalGeometry &geometry);
  void resizeTab(Tab *tab, float viewportWidth, float viewportHeight,
                 float cellWidth, float cellHeight);
  /** @brief Index of the tab owning `id`, or -1. */
  int findTabIndex(SessionId id) const;
  /** @brief Removes a tab other than the last one, keeping `active` on the
   * same tab where possible. */
  void removeTab(int index);

  shared_ptr<PseudoTerminalFactory> factory;
  shared_ptr<SessionEventQueue> events;
  int maxPanes;
  float dividerThreshold;
  float minRatio;
  float maxRatio;
  int historyLines;
  int shutdownGraceMs;

  vector<unique_ptr<Tab>> tabs;
  int active;
  SessionId nextSessionId;
  /** @brief Divider being dragged in the active tab. */
  optional<DividerInfo> drag;
};
}  // namespace tt

#endif  // __TT_TAB_MANAGER__
