#ifndef __TT_PANE_TREE__
#define __TT_PANE_TREE__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "SessionId.hpp"

namespace tt {
enum class SplitAxis {
  /** @brief Children side by side, the divider is a vertical line. */
  Vertical,
  /** @brief Children stacked, the divider is a horizontal line. */
  Horizontal,
};

/** @brief Path from the root to a split node: false=left, true=right. */
typedef vector<bool> DividerPath;

/** @brief Pixel rectangle of one pane, recomputed on every query. */
struct PaneLayout {
  SessionId sessionId;
  float x;
  float y;
  float width;
  float height;

  float centerX() const { return x + width / 2.0f; }
  float centerY() const { return y + height / 2.0f; }
  bool contains(float px, float py) const {
    return px >= x && px < x + width && py >= y && py < y + height;
  }
};

/** @brief One internal split node seen as a draggable line. */
struct DividerInfo {
  SplitAxis axis;
  /** @brief Pixel position of the line (x for vertical, y for horizontal). */
  float position;
  /** @brief Start of the split dimension. */
  float origin;
  /** @brief Total extent of the split dimension. */
  float span;
  /** @brief Perpendicular bounds used for hit-testing. */
  float perpStart;
  float perpEnd;
  DividerPath path;
};

/**
 * @brief Binary split tree describing how one tab is tiled into panes.
 *
 * Leaves carry a session id, split nodes carry an axis, a ratio and two
 * children.  The tree always holds at least one leaf and exactly one active
 * leaf; removing the last leaf is reported to the caller instead of being
 * performed.
 */
class PaneTree {
 public:
  static constexpr float DEFAULT_MIN_RATIO = 0.1f;
  static constexpr float DEFAULT_MAX_RATIO = 0.9f;

  explicit PaneTree(SessionId initialSession,
                    float _minRatio = DEFAULT_MIN_RATIO,
                    float _maxRatio = DEFAULT_MAX_RATIO);
  ~PaneTree();
  PaneTree(PaneTree &&other);
  PaneTree &operator=(PaneTree &&other);

  int paneCount() const;
  inline SessionId activeSessionId() const { return active; }
  inline bool isZoomed() const { return zoomed; }
  bool contains(SessionId id) const;

  /** @brief Makes `id` the active leaf; ignored when `id` is not in the tree.
   */
  bool setActive(SessionId id);

  /** @brief Zoom only changes what `calculateLayouts` reports. */
  void toggleZoom();

  /**
   * @brief Replaces the active leaf with a split holding the old leaf on the
   * left/top and `newSession` on the right/bottom; the new leaf becomes
   * active.
   */
  void splitActive(SplitAxis axis, SessionId newSession);

  /**
   * @brief Removes the active leaf, promoting its sibling into the parent's
   * slot.
   * @return true when the active leaf is the last one; the tree is left
   * untouched and the caller must close the owning tab.
   */
  bool closeActive();

  /** @brief Cycles through leaves in left-to-right order, wrapping around. */
  void focusNext();
  void focusPrev();

  /** @brief Session ids in left-to-right leaf order. */
  vector<SessionId> sessionIds() const;

  vector<PaneLayout> calculateLayouts(float width, float height) const;
  /** @brief Every leaf's rectangle as if the tree were not zoomed. */
  vector<PaneLayout> tiledLayouts(float width, float height) const;
  vector<DividerInfo> collectDividers(float width, float height) const;

  /**
   * @brief Sets the ratio of the split node addressed by `path`, clamped to
   * the tree's ratio bounds.
   * @return false if the path does not address a split node (e.g. it went
   * stale after a close); the tree is unchanged in that case.
   */
  bool setRatioAt(const DividerPath &path, float ratio);

  /** @brief Ratio of the split node at `path`, if there is one. */
  optional<float> ratioAt(const DividerPath &path) const;

  /** @brief Structure dump: `{"session": id}` or
   * `{"axis", "ratio", "left", "right"}`. */
  json toJson() const;

 protected:
  struct Node;
  struct RemoveResult;

  static RemoveResult removeLeaf(unique_ptr<Node> node, SessionId target);

  unique_ptr<Node> root;
  SessionId active;
  bool zoomed;
  float minRatio;
  float maxRatio;
};
}  // namespace tt

#endif  // __TT_PANE_TREE__
