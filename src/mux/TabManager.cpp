#include "TabManager.hpp"

namespace tt {
TabManager::TabManager(const TileTermConfig &config,
                       shared_ptr<PseudoTerminalFactory> _factory,
                       shared_ptr<SessionEventQueue> _events)
    : factory(_factory),
      events(_events),
      maxPanes(config.maxPanes),
      dividerThreshold(config.dividerThreshold),
      minRatio(config.minRatio),
      maxRatio(config.maxRatio),
      historyLines(config.historyLines),
      shutdownGraceMs(config.shutdownGraceMs),
      active(0),
      nextSessionId(0) {
  GridSize grid = gridForRect(config.width, config.height, config.cellWidth,
                              config.cellHeight);
  addTab(TerminalGeometry{grid.columns, grid.rows, config.cellWidth,
                          config.cellHeight});
}

TabManager::~TabManager() {
  // Signal every session first so the children wind down in parallel
  for (auto &tab : tabs) {
    tab->shutdownAll();
  }
  tabs.clear();
}

unique_ptr<Session> TabManager::spawnSession(
    const TerminalGeometry &geometry) {
  SessionId id = nextSessionId++;
  VLOG(1) << "Spawning session " << id << " at " << geometry;
  return unique_ptr<Session>(new Session(id, factory->create(), geometry,
                                         events, historyLines,
                                         shutdownGraceMs));
}

int TabManager::addTab(const TerminalGeometry &geometry) {
  unique_ptr<Session> session = spawnSession(geometry);
  string title = string("Tab ") + to_string(tabs.size() + 1);
  tabs.push_back(unique_ptr<Tab>(
      new Tab(title, std::move(session), minRatio, maxRatio)));
  active = int(tabs.size()) - 1;
  drag.reset();
  LOG(INFO) << "Opened " << title;
  return active;
}

bool TabManager::closeActiveTab() {
  drag.reset();
  if (tabs.size() <= 1) {
    if (!tabs.empty()) {
      tabs.front()->shutdownAll();
    }
    return true;
  }
  LOG(INFO) << "Closing " << tabs[active]->title;
  tabs.erase(tabs.begin() + active);
  if (active >= int(tabs.size())) {
    active = int(tabs.size()) - 1;
  }
  return false;
}

void TabManager::removeTab(int index) {
  LOG(INFO) << "Closing " << tabs[index]->title;
  tabs.erase(tabs.begin() + index);
  if (index < active) {
    active--;
  }
  if (active >= int(tabs.size())) {
    active = int(tabs.size()) - 1;
  }
}

bool TabManager::closeActivePane(float viewportWidth, float viewportHeight,
                                 float cellWidth, float cellHeight) {
  drag.reset();
  Tab *tab = activeTab();
  SessionId id = tab->tree.activeSessionId();
  if (tab->tree.closeActive()) {
    return closeActiveTab();
  }
  VLOG(1) << "Closing session " << id;
  tab->sessions.erase(id);
  resizeTab(tab, viewportWidth, viewportHeight, cellWidth, cellHeight);
  return false;
}

int TabManager::findTabIndex(SessionId id) const {
  for (int a = 0; a < int(tabs.size()); a++) {
    if (tabs[a]->ownsSession(id)) {
      return a;
    }
  }
  return -1;
}

bool TabManager::closePaneById(SessionId id) {
  int index = findTabIndex(id);
  if (index < 0) {
    VLOG(2) << "Ignoring close of unknown session " << id;
    return false;
  }
  drag.reset();
  Tab *tab = tabs[index].get();
  SessionId previousActive = tab->tree.activeSessionId();

  // The tree only removes its active leaf
  tab->tree.setActive(id);
  if (tab->tree.closeActive()) {
    if (index == active) {
      return closeActiveTab();
    }
    // Another tab always remains here since the active tab is still open
    removeTab(index);
    return false;
  }
  if (previousActive != id) {
    tab->tree.setActive(previousActive);
  }
  VLOG(1) << "Closing session " << id;
  tab->sessions.erase(id);
  return false;
}

void TabManager::nextTab() {
  if (tabs.size() > 1) {
    drag.reset();
    active = (active + 1) % int(tabs.size());
  }
}

void TabManager::prevTab() {
  if (tabs.size() > 1) {
    drag.reset();
    active = active == 0 ? int(tabs.size()) - 1 : active - 1;
  }
}

bool TabManager::gotoTab(int index) {
  if (index < 0 || index >= int(tabs.size())) {
    return false;
  }
  if (index != active) {
    drag.reset();
  }
  active = index;
  return true;
}

bool TabManager::splitActive(SplitAxis axis, const TerminalGeometry &geometry,
                             float viewportWidth, float viewportHeight) {
  Tab *tab = activeTab();
  if (tab->tree.paneCount() >= maxPanes) {
    LOG(WARNING) << "Refusing to split: " << tab->title << " already has "
                 << maxPanes << " panes";
    return false;
  }
  unique_ptr<Session> session = spawnSession(geometry);
  SessionId id = session->getId();
  tab->tree.splitActive(axis, id);
  tab->sessions.insert(make_pair(id, std::move(session)));
  drag.reset();
  resizeTab(tab, viewportWidth, viewportHeight, geometry.cellWidth,
            geometry.cellHeight);
  return true;
}

void TabManager::toggleZoom(float viewportWidth, float viewportHeight,
                            float cellWidth, float cellHeight) {
  activeTab()->tree.toggleZoom();
  resizeActiveTab(viewportWidth, viewportHeight, cellWidth, cellHeight);
}

void TabManager::focusNextPane() { activeTab()->tree.focusNext(); }

void TabManager::focusPrevPane() { activeTab()->tree.focusPrev(); }

bool TabManager::focusPane(SessionId id) {
  return activeTab()->tree.setActive(id);
}

bool TabManager::focusDirection(FocusDirection direction, float viewportWidth,
                                float viewportHeight) {
  auto target =
      findPaneInDirection(activeLayouts(viewportWidth, viewportHeight),
                          activeSessionId(), direction);
  if (!target) {
    return false;
  }
  return focusPane(*target);
}

bool TabManager::focusPaneAt(float x, float y, float viewportWidth,
                             float viewportHeight) {
  auto target =
      findPaneAt(activeLayouts(viewportWidth, viewportHeight), x, y);
  if (!target) {
    return false;
  }
  return focusPane(*target);
}

bool TabManager::setSplitRatio(const DividerPath &path, float ratio) {
  return activeTab()->tree.setRatioAt(path, ratio);
}

bool TabManager::beginDividerDrag(float x, float y, float viewportWidth,
                                  float viewportHeight) {
  drag = findDividerAt(activeDividers(viewportWidth, viewportHeight), x, y,
                       dividerThreshold);
  return isDragging();
}

bool TabManager::updateDividerDrag(float x, float y, float viewportWidth,
                                   float viewportHeight, float cellWidth,
                                   float cellHeight) {
  if (!drag) {
    return false;
  }
  auto ratio = dragRatio(*drag, x, y, minRatio, maxRatio);
  if (!ratio) {
    return false;
  }
  if (!setSplitRatio(drag->path, *ratio)) {
    VLOG(2) << "Dropping stale divider drag";
    drag.reset();
    return false;
  }
  resizeActiveTab(viewportWidth, viewportHeight, cellWidth, cellHeight);
  return true;
}

void TabManager::endDividerDrag() { drag.reset(); }

void TabManager::resizeTab(Tab *tab, float viewportWidth,
                           float viewportHeight, float cellWidth,
                           float cellHeight) {
  // While zoomed, hidden panes keep the size of their tiled rectangle
  bool zoomed = tab->tree.isZoomed();
  SessionId zoomedId = tab->tree.activeSessionId();
  for (const PaneLayout &l :
       tab->tree.tiledLayouts(viewportWidth, viewportHeight)) {
    Session *session = tab->getSession(l.sessionId);
    if (session == nullptr) {
      STFATAL << "Layout references a session with no pane: " << l.sessionId;
    }
    GridSize grid =
        (zoomed && l.sessionId == zoomedId)
            ? gridForRect(viewportWidth, viewportHeight, cellWidth, cellHeight)
            : gridForRect(l.width, l.height, cellWidth, cellHeight);
    session->resize(
        TerminalGeometry{grid.columns, grid.rows, cellWidth, cellHeight});
  }
}

void TabManager::resizeAll(float viewportWidth, float viewportHeight,
                           float cellWidth, float cellHeight) {
  for (auto &tab : tabs) {
    resizeTab(tab.get(), viewportWidth, viewportHeight, cellWidth,
              cellHeight);
  }
}

void TabManager::resizeActiveTab(float viewportWidth, float viewportHeight,
                                 float cellWidth, float cellHeight) {
  resizeTab(activeTab(), viewportWidth, viewportHeight, cellWidth,
            cellHeight);
}

bool TabManager::setTabTitleBySession(SessionId id, const string &title) {
  int index = findTabIndex(id);
  if (index < 0) {
    return false;
  }
  tabs[index]->title = sanitizeTitle(title);
  return true;
}

void TabManager::sendInput(const string &bytes) {
  Session *session = activeSession();
  if (session == nullptr) {
    STFATAL << "Active pane has no session";
  }
  session->sendInput(bytes);
}

bool TabManager::processEvents(float viewportWidth, float viewportHeight,
                               float cellWidth, float cellHeight) {
  for (const SessionEvent &event : events->poll()) {
    switch (event.type) {
      case SessionEvent::WAKEUP:
        VLOG(4) << "Session " << event.sessionId << " has new output";
        break;
      case SessionEvent::CHILD_EXIT:
        LOG(INFO) << "Pane " << event.sessionId << " exited with code "
                  << event.exitCode;
        drag.reset();
        if (closePaneById(event.sessionId)) {
          return true;
        }
        resizeAll(viewportWidth, viewportHeight, cellWidth, cellHeight);
        break;
    }
  }
  return false;
}

SessionId TabManager::activeSessionId() const {
  return activeTab()->tree.activeSessionId();
}

Session *TabManager::activeSession() const {
  return activeTab()->getSession(activeSessionId());
}

vector<PaneLayout> TabManager::activeLayouts(float viewportWidth,
                                             float viewportHeight) const {
  return activeTab()->tree.calculateLayouts(viewportWidth, viewportHeight);
}

vector<DividerInfo> TabManager::activeDividers(float viewportWidth,
                                               float viewportHeight) const {
  return activeTab()->tree.collectDividers(viewportWidth, viewportHeight);
}

json TabManager::toJson() const {
  json state;
  state["activeTab"] = active;
  state["activeSession"] = activeSessionId();
  state["nextSessionId"] = nextSessionId;
  state["tabs"] = json::array();
  for (auto &tab : tabs) {
    state["tabs"].push_back(tab->toJson());
  }
  return state;
}
}  // namespace tt
