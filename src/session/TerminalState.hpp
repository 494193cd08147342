#ifndef __TT_TERMINAL_STATE__
#define __TT_TERMINAL_STATE__

#include "FairMutex.hpp"
#include "Headers.hpp"

namespace tt {
/** @brief Inclusive range of text selected by the user, in line/column
 * coordinates relative to the oldest retained line. */
struct SelectionRange {
  int startLine;
  int startColumn;
  int endLine;
  int endColumn;
};

/**
 * @brief Screen contents shared between a session thread and the UI thread.
 *
 * The session thread is the only writer of incoming output
 * (`applyOutput`); the UI thread owns the scroll position, the selection and
 * the grid size.  Always accessed through `FairMutex<TerminalState>`.
 */
class TerminalState {
 public:
  TerminalState(int _columns, int _rows, int _historyLines);

  /** @brief Appends child output, splitting on newlines and dropping CRs. */
  void applyOutput(const string &bytes);

  void resize(int _columns, int _rows);

  /** @brief Scrolls into history (positive) or back towards the bottom. */
  void scrollBy(int lines);

  void setSelection(const SelectionRange &range);
  void clearSelection();
  inline const optional<SelectionRange> &getSelection() const {
    return selection;
  }
  string selectedText() const;

  /** @brief The `rows` lines currently on screen, oldest first. */
  vector<string> visibleLines() const;

  inline int getColumns() const { return columns; }
  inline int getRows() const { return rows; }
  inline int getScrollOffset() const { return scrollOffset; }
  inline size_t lineCount() const { return lines.size(); }
  inline uint64_t getBytesProcessed() const { return bytesProcessed; }
  inline bool mouseReportingEnabled() const { return mouseReporting; }
  inline void setMouseReporting(bool enabled) { mouseReporting = enabled; }

 protected:
  void trimHistory();

  int columns;
  int rows;
  int historyLines;
  /** @brief Retained lines; the back is the line being written. */
  deque<string> lines;
  int scrollOffset;
  optional<SelectionRange> selection;
  bool mouseReporting;
  uint64_t bytesProcessed;
};

typedef FairMutex<TerminalState> SharedTerminal;
}  // namespace tt

#endif  // __TT_TERMINAL_STATE__
