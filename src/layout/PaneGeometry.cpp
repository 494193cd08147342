#include "PaneGeometry.hpp"

namespace tt {
optional<SessionId> findPaneInDirection(const vector<PaneLayout> &layouts,
                                        SessionId active,
                                        FocusDirection direction) {
  auto activeIt =
      std::find_if(layouts.begin(), layouts.end(),
                   [active](const PaneLayout &l) { return l.sessionId == active; });
  if (activeIt == layouts.end()) {
    return nullopt;
  }
  float ax = activeIt->centerX();
  float ay = activeIt->centerY();

  optional<SessionId> best;
  float bestDistance = 0;
  for (const PaneLayout &l : layouts) {
    if (l.sessionId == active) {
      continue;
    }
    float dx = l.centerX() - ax;
    float dy = l.centerY() - ay;
    bool candidate = false;
    switch (direction) {
      case FocusDirection::Left:
        candidate = dx < 0;
        break;
      case FocusDirection::Right:
        candidate = dx > 0;
        break;
      case FocusDirection::Up:
        candidate = dy < 0;
        break;
      case FocusDirection::Down:
        candidate = dy > 0;
        break;
    }
    if (!candidate) {
      continue;
    }
    float distance = dx * dx + dy * dy;
    if (!best || distance < bestDistance) {
      best = l.sessionId;
      bestDistance = distance;
    }
  }
  return best;
}

optional<SessionId> findPaneAt(const vector<PaneLayout> &layouts, float x,
                               float y) {
  for (const PaneLayout &l : layouts) {
    if (l.contains(x, y)) {
      return l.sessionId;
    }
  }
  return nullopt;
}

optional<DividerInfo> findDividerAt(const vector<DividerInfo> &dividers,
                                    float x, float y, float threshold) {
  for (const DividerInfo &d : dividers) {
    float along = d.axis == SplitAxis::Vertical ? x : y;
    float perp = d.axis == SplitAxis::Vertical ? y : x;
    if (std::fabs(along - d.position) <= threshold && perp >= d.perpStart &&
        perp <= d.perpEnd) {
      return d;
    }
  }
  return nullopt;
}

optional<float> dragRatio(const DividerInfo &divider, float x, float y,
                          float minRatio, float maxRatio) {
  if (divider.span < 1.0f) {
    return nullopt;
  }
  float along = divider.axis == SplitAxis::Vertical ? x : y;
  return std::clamp((along - divider.origin) / divider.span, minRatio,
                    maxRatio);
}

GridSize gridForRect(float width, float height, float cellWidth,
                     float cellHeight) {
  int columns = int(std::max(width, 0.0f) / cellWidth);
  int rows = int(std::max(height, 0.0f) / cellHeight);
  return GridSize{std::max(columns, MIN_GRID_COLUMNS),
                  std::max(rows, MIN_GRID_ROWS)};
}

FocusDirection parseFocusDirection(const string &name) {
  if (name == "left") {
    return FocusDirection::Left;
  }
  if (name == "right") {
    return FocusDirection::Right;
  }
  if (name == "up") {
    return FocusDirection::Up;
  }
  if (name == "down") {
    return FocusDirection::Down;
  }
  throw std::invalid_argument("Unknown focus direction: " + name);
}
}  // namespace tt
