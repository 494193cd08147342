#ifndef __TT_TERMINAL_GEOMETRY__
#define __TT_TERMINAL_GEOMETRY__

#include "Headers.hpp"

namespace tt {
/** @brief Grid and cell size reported to a session's child process. */
struct TerminalGeometry {
  int columns;
  int rows;
  float cellWidth;
  float cellHeight;

  winsize toWinsize() const {
    winsize tmpwin;
    tmpwin.ws_col = (unsigned short)columns;
    tmpwin.ws_row = (unsigned short)rows;
    tmpwin.ws_xpixel = (unsigned short)(columns * cellWidth);
    tmpwin.ws_ypixel = (unsigned short)(rows * cellHeight);
    return tmpwin;
  }

  bool operator==(const TerminalGeometry &other) const {
    return columns == other.columns && rows == other.rows &&
           cellWidth == other.cellWidth && cellHeight == other.cellHeight;
  }
  bool operator!=(const TerminalGeometry &other) const {
    return !(*this == other);
  }
};

inline std::ostream &operator<<(std::ostream &os, const TerminalGeometry &g) {
  os << g.columns << "x" << g.rows << " (" << g.cellWidth << "x"
     << g.cellHeight << "px cells)";
  return os;
}
}  // namespace tt

#endif  // __TT_TERMINAL_GEOMETRY__
