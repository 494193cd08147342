#ifndef __TT_PANE_GEOMETRY__
#define __TT_PANE_GEOMETRY__

#include "Headers.hpp"
#include "PaneTree.hpp"

namespace tt {
enum class FocusDirection { Left, Right, Up, Down };

/** @brief Character grid that fits in a pane rectangle. */
struct GridSize {
  int columns;
  int rows;
};

/** @brief Minimum grid handed to a session, however small its pane is. */
const int MIN_GRID_COLUMNS = 2;
const int MIN_GRID_ROWS = 1;

/**
 * @brief Picks the pane to focus when moving from `active` in `direction`.
 *
 * Only panes whose center lies strictly on that side of the active pane's
 * center are candidates; the closest center (euclidean) wins.  The search is
 * purely spatial and never looks at the tree.
 */
optional<SessionId> findPaneInDirection(const vector<PaneLayout> &layouts,
                                        SessionId active,
                                        FocusDirection direction);

/** @brief The pane whose rectangle contains the point, if any. */
optional<SessionId> findPaneAt(const vector<PaneLayout> &layouts, float x,
                               float y);

/**
 * @brief The divider under the cursor: within `threshold` pixels along the
 * split axis and inside the divider's perpendicular bounds.
 */
optional<DividerInfo> findDividerAt(const vector<DividerInfo> &dividers,
                                    float x, float y, float threshold);

/**
 * @brief Ratio a divider should take when dragged to (x, y).
 * @return nullopt when the divider's span is too small to divide.
 */
optional<float> dragRatio(const DividerInfo &divider, float x, float y,
                          float minRatio, float maxRatio);

/** @brief Columns/rows of `cellWidth` x `cellHeight` cells in a rectangle. */
GridSize gridForRect(float width, float height, float cellWidth,
                     float cellHeight);

FocusDirection parseFocusDirection(const string &name);
}  // namespace tt

#endif  // __TT_PANE_GEOMETRY__
