#include "TerminalState.hpp"

namespace tt {
TerminalState::TerminalState(int _columns, int _rows, int _historyLines)
    : columns(_columns),
      rows(_rows),
      historyLines(_historyLines),
      lines(1),
      scrollOffset(0),
      mouseReporting(false),
      bytesProcessed(0) {}

void TerminalState::applyOutput(const string &bytes) {
  bytesProcessed += bytes.size();
  for (char c : bytes) {
    if (c == '\r') {
      continue;
    }
    if (c == '\n') {
      lines.emplace_back();
      continue;
    }
    lines.back().push_back(c);
  }
  trimHistory();
}

void TerminalState::resize(int _columns, int _rows) {
  columns = _columns;
  rows = _rows;
  trimHistory();
}

void TerminalState::scrollBy(int delta) {
  int maxOffset = std::max(0, int(lines.size()) - rows);
  scrollOffset = std::clamp(scrollOffset + delta, 0, maxOffset);
}

void TerminalState::setSelection(const SelectionRange &range) {
  selection = range;
}

void TerminalState::clearSelection() { selection.reset(); }

string TerminalState::selectedText() const {
  if (!selection) {
    return string();
  }
  SelectionRange r = *selection;
  if (r.startLine > r.endLine ||
      (r.startLine == r.endLine && r.startColumn > r.endColumn)) {
    std::swap(r.startLine, r.endLine);
    std::swap(r.startColumn, r.endColumn);
  }
  string text;
  for (int line = std::max(r.startLine, 0);
       line <= r.endLine && line < int(lines.size()); line++) {
    const string &s = lines[line];
    size_t begin = line == r.startLine ? size_t(r.startColumn) : 0;
    size_t end = line == r.endLine ? size_t(r.endColumn) + 1 : s.size();
    if (begin < s.size()) {
      text.append(s, begin, std::min(end, s.size()) - begin);
    }
    if (line != r.endLine) {
      text.push_back('\n');
    }
  }
  return text;
}

vector<string> TerminalState::visibleLines() const {
  int end = int(lines.size()) - scrollOffset;
  int begin = std::max(0, end - rows);
  return vector<string>(lines.begin() + begin, lines.begin() + end);
}

void TerminalState::trimHistory() {
  size_t maxLines = size_t(historyLines) + size_t(rows);
  if (lines.size() <= maxLines) {
    return;
  }
  int amountToErase = int(lines.size() - maxLines);
  lines.erase(lines.begin(), lines.begin() + amountToErase);
  // Selection coordinates are relative to the oldest line and are now stale
  selection.reset();
  scrollOffset = std::min(scrollOffset, std::max(0, int(lines.size()) - rows));
}
}  // namespace tt
