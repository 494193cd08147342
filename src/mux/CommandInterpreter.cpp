#include "CommandInterpreter.hpp"

namespace tt {
namespace {
string pathToString(const DividerPath &path) {
  if (path.empty()) {
    return "root";
  }
  string s;
  for (bool right : path) {
    s.push_back(right ? 'R' : 'L');
  }
  return s;
}

string restOfLine(std::istringstream *args) {
  string rest;
  std::getline(*args, rest);
  if (!rest.empty() && rest[0] == ' ') {
    rest = rest.substr(1);
  }
  return rest;
}
}  // namespace

CommandInterpreter::CommandInterpreter(shared_ptr<TabManager> _manager,
                                       shared_ptr<SessionEventQueue> _events,
                                       const TileTermConfig &config)
    : manager(_manager),
      events(_events),
      viewportWidth(config.width),
      viewportHeight(config.height),
      cellWidth(config.cellWidth),
      cellHeight(config.cellHeight) {}

string CommandInterpreter::unescape(const string &text) {
  string s;
  for (size_t a = 0; a < text.size(); a++) {
    if (text[a] != '\\' || a + 1 == text.size()) {
      s.push_back(text[a]);
      continue;
    }
    char c = text[++a];
    switch (c) {
      case 'n':
        s.push_back('\n');
        break;
      case 'r':
        s.push_back('\r');
        break;
      case 't':
        s.push_back('\t');
        break;
      case 'e':
        s.push_back('\x1b');
        break;
      case '\\':
        s.push_back('\\');
        break;
      default:
        s.push_back('\\');
        s.push_back(c);
        break;
    }
  }
  return s;
}

TerminalGeometry CommandInterpreter::newPaneGeometry() const {
  GridSize grid =
      gridForRect(viewportWidth, viewportHeight, cellWidth, cellHeight);
  return TerminalGeometry{grid.columns, grid.rows, cellWidth, cellHeight};
}

bool CommandInterpreter::processEvents() {
  return manager->processEvents(viewportWidth, viewportHeight, cellWidth,
                                cellHeight);
}

bool CommandInterpreter::waitForEvents(int ms) {
  auto deadline =
      std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
  while (true) {
    if (processEvents()) {
      return true;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return false;
    }
    events->waitFor(std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - now));
  }
}

void CommandInterpreter::describeLayouts(vector<string> *output) const {
  SessionId activeId = manager->activeSessionId();
  for (const PaneLayout &l :
       manager->activeLayouts(viewportWidth, viewportHeight)) {
    std::ostringstream ss;
    ss << (l.sessionId == activeId ? "* " : "  ") << "pane " << l.sessionId
       << " x=" << l.x << " y=" << l.y << " w=" << l.width
       << " h=" << l.height;
    output->push_back(ss.str());
  }
}

void CommandInterpreter::describeDividers(vector<string> *output) const {
  for (const DividerInfo &d :
       manager->activeDividers(viewportWidth, viewportHeight)) {
    std::ostringstream ss;
    ss << (d.axis == SplitAxis::Vertical ? "vertical" : "horizontal")
       << " at " << d.position << " path=" << pathToString(d.path)
       << " span=" << d.span;
    output->push_back(ss.str());
  }
}

void CommandInterpreter::describeTabs(vector<string> *output) const {
  const auto &tabs = manager->getTabs();
  for (int a = 0; a < int(tabs.size()); a++) {
    std::ostringstream ss;
    ss << (a == manager->activeIndex() ? "* " : "  ") << (a + 1) << ": "
       << tabs[a]->title << " (" << tabs[a]->tree.paneCount() << " panes)";
    output->push_back(ss.str());
  }
}

void CommandInterpreter::describeScreen(vector<string> *output) const {
  Session *session = manager->activeSession();
  auto guard = session->terminal()->lock();
  for (const string &line : guard->visibleLines()) {
    output->push_back(line);
  }
}

bool CommandInterpreter::execute(const string &line, vector<string> *output) {
  std::istringstream args(line);
  string command;
  if (!(args >> command) || command[0] == '#') {
    return false;
  }
  VLOG(2) << "Command: " << line;

  if (command == "quit") {
    return true;
  } else if (command == "new-tab") {
    try {
      int index = manager->addTab(newPaneGeometry());
      manager->resizeActiveTab(viewportWidth, viewportHeight, cellWidth,
                               cellHeight);
      output->push_back(string("tab ") + to_string(index + 1));
    } catch (const std::runtime_error &ex) {
      output->push_back(string("error: ") + ex.what());
    }
  } else if (command == "close-pane") {
    if (manager->closeActivePane(viewportWidth, viewportHeight, cellWidth,
                                 cellHeight)) {
      return true;
    }
  } else if (command == "close-tab") {
    return manager->closeActiveTab();
  } else if (command == "close-id") {
    SessionId id;
    if (!(args >> id)) {
      output->push_back("error: usage: close-id ID");
      return false;
    }
    if (manager->closePaneById(id)) {
      return true;
    }
    manager->resizeAll(viewportWidth, viewportHeight, cellWidth, cellHeight);
  } else if (command == "next-tab") {
    manager->nextTab();
  } else if (command == "prev-tab") {
    manager->prevTab();
  } else if (command == "goto-tab") {
    int index;
    if (!(args >> index) || !manager->gotoTab(index - 1)) {
      output->push_back("error: no such tab");
    }
  } else if (command == "split") {
    string axisName;
    args >> axisName;
    SplitAxis axis;
    if (axisName == "v") {
      axis = SplitAxis::Vertical;
    } else if (axisName == "h") {
      axis = SplitAxis::Horizontal;
    } else {
      output->push_back("error: usage: split v|h");
      return false;
    }
    try {
      if (!manager->splitActive(axis, newPaneGeometry(), viewportWidth,
                                viewportHeight)) {
        output->push_back("error: pane limit reached");
      } else {
        output->push_back(string("pane ") +
                          to_string(manager->activeSessionId()));
      }
    } catch (const std::runtime_error &ex) {
      output->push_back(string("error: ") + ex.what());
    }
  } else if (command == "zoom") {
    manager->toggleZoom(viewportWidth, viewportHeight, cellWidth, cellHeight);
  } else if (command == "focus") {
    string target;
    args >> target;
    if (target == "next") {
      manager->focusNextPane();
    } else if (target == "prev") {
      manager->focusPrevPane();
    } else {
      try {
        manager->focusDirection(parseFocusDirection(target), viewportWidth,
                                viewportHeight);
      } catch (const std::invalid_argument &ex) {
        output->push_back(string("error: ") + ex.what());
      }
    }
  } else if (command == "focus-id") {
    SessionId id;
    if (!(args >> id) || !manager->focusPane(id)) {
      output->push_back("error: no such pane in this tab");
    }
  } else if (command == "click") {
    float x, y;
    if (!(args >> x >> y)) {
      output->push_back("error: usage: click X Y");
      return false;
    }
    manager->focusPaneAt(x, y, viewportWidth, viewportHeight);
  } else if (command == "drag") {
    float x, y, x2, y2;
    if (!(args >> x >> y >> x2 >> y2)) {
      output->push_back("error: usage: drag X Y X2 Y2");
      return false;
    }
    if (!manager->beginDividerDrag(x, y, viewportWidth, viewportHeight)) {
      output->push_back("error: no divider there");
      return false;
    }
    manager->updateDividerDrag(x2, y2, viewportWidth, viewportHeight,
                               cellWidth, cellHeight);
    manager->endDividerDrag();
  } else if (command == "resize") {
    float w, h;
    if (!(args >> w >> h) || w <= 0 || h <= 0) {
      output->push_back("error: usage: resize W H");
      return false;
    }
    viewportWidth = w;
    viewportHeight = h;
    manager->resizeAll(viewportWidth, viewportHeight, cellWidth, cellHeight);
  } else if (command == "title") {
    SessionId id;
    if (!(args >> id)) {
      output->push_back("error: usage: title ID TEXT");
      return false;
    }
    if (!manager->setTabTitleBySession(id, restOfLine(&args))) {
      output->push_back("error: no such pane");
    }
  } else if (command == "send") {
    manager->sendInput(unescape(restOfLine(&args)));
  } else if (command == "scroll") {
    int lines;
    if (!(args >> lines)) {
      output->push_back("error: usage: scroll N");
      return false;
    }
    auto guard = manager->activeSession()->terminal()->lock();
    guard->scrollBy(lines);
  } else if (command == "select") {
    SelectionRange range;
    if (!(args >> range.startLine >> range.startColumn >> range.endLine >>
          range.endColumn)) {
      output->push_back("error: usage: select L1 C1 L2 C2");
      return false;
    }
    string text;
    {
      // One lock for the mode check and the selection change
      auto guard = manager->activeSession()->terminal()->lock();
      if (guard->mouseReportingEnabled()) {
        output->push_back("error: the application is capturing the mouse");
        return false;
      }
      guard->setSelection(range);
      text = guard->selectedText();
    }
    output->push_back(text);
  } else if (command == "layouts") {
    describeLayouts(output);
  } else if (command == "dividers") {
    describeDividers(output);
  } else if (command == "tabs") {
    describeTabs(output);
  } else if (command == "screen") {
    describeScreen(output);
  } else if (command == "dump") {
    output->push_back(dumpJson(manager->toJson(), true));
  } else if (command == "wait") {
    int ms;
    if (!(args >> ms) || ms < 0) {
      output->push_back("error: usage: wait MS");
      return false;
    }
    return waitForEvents(ms);
  } else {
    output->push_back(string("error: unknown command: ") + command);
    return false;
  }
  return processEvents();
}
}  // namespace tt
