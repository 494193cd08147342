#include "PaneTree.hpp"

namespace tt {
struct PaneTree::Node {
  bool leaf;
  SessionId sessionId;
  SplitAxis axis;
  float ratio;
  unique_ptr<Node> left;
  unique_ptr<Node> right;

  static unique_ptr<Node> makeLeaf(SessionId id) {
    unique_ptr<Node> node(new Node());
    node->leaf = true;
    node->sessionId = id;
    node->axis = SplitAxis::Vertical;
    node->ratio = 0.5f;
    return node;
  }

  static unique_ptr<Node> makeSplit(SplitAxis axis, float ratio,
                                    unique_ptr<Node> left,
                                    unique_ptr<Node> right) {
    unique_ptr<Node> node(new Node());
    node->leaf = false;
    node->sessionId = 0;
    node->axis = axis;
    node->ratio = ratio;
    node->left = std::move(left);
    node->right = std::move(right);
    return node;
  }

  int paneCount() const {
    if (leaf) {
      return 1;
    }
    return left->paneCount() + right->paneCount();
  }

  void collectSessionIds(vector<SessionId> *ids) const {
    if (leaf) {
      ids->push_back(sessionId);
      return;
    }
    left->collectSessionIds(ids);
    right->collectSessionIds(ids);
  }

  // Splitting uses floor on the primary child so the two children always add
  // up to the parent's extent.
  void calculateLayouts(float x, float y, float w, float h,
                        vector<PaneLayout> *layouts) const {
    if (leaf) {
      layouts->push_back(PaneLayout{sessionId, x, y, w, h});
      return;
    }
    if (axis == SplitAxis::Vertical) {
      float leftW = std::floor(w * ratio);
      left->calculateLayouts(x, y, leftW, h, layouts);
      right->calculateLayouts(x + leftW, y, w - leftW, h, layouts);
    } else {
      float topH = std::floor(h * ratio);
      left->calculateLayouts(x, y, w, topH, layouts);
      right->calculateLayouts(x, y + topH, w, h - topH, layouts);
    }
  }

  void collectDividers(float x, float y, float w, float h, DividerPath *path,
                       vector<DividerInfo> *dividers) const {
    if (leaf) {
      return;
    }
    if (axis == SplitAxis::Vertical) {
      float leftW = std::floor(w * ratio);
      dividers->push_back(
          DividerInfo{axis, x + leftW, x, w, y, y + h, *path});
      path->push_back(false);
      left->collectDividers(x, y, leftW, h, path, dividers);
      path->back() = true;
      right->collectDividers(x + leftW, y, w - leftW, h, path, dividers);
      path->pop_back();
    } else {
      float topH = std::floor(h * ratio);
      dividers->push_back(
          DividerInfo{axis, y + topH, y, h, x, x + w, *path});
      path->push_back(false);
      left->collectDividers(x, y, w, topH, path, dividers);
      path->back() = true;
      right->collectDividers(x, y + topH, w, h - topH, path, dividers);
      path->pop_back();
    }
  }

  Node *findSplit(const DividerPath &path) {
    Node *node = this;
    for (bool goRight : path) {
      if (node->leaf) {
        return nullptr;
      }
      node = goRight ? node->right.get() : node->left.get();
    }
    return node->leaf ? nullptr : node;
  }

  bool splitLeaf(SessionId target, SplitAxis newAxis, SessionId newId,
                 unique_ptr<Node> *self) {
    if (leaf) {
      if (sessionId != target) {
        return false;
      }
      unique_ptr<Node> old = std::move(*self);
      *self = makeSplit(newAxis, 0.5f, std::move(old), makeLeaf(newId));
      return true;
    }
    return left->splitLeaf(target, newAxis, newId, &left) ||
           right->splitLeaf(target, newAxis, newId, &right);
  }

  json toJson() const {
    json j;
    if (leaf) {
      j["session"] = sessionId;
      return j;
    }
    j["axis"] = axis == SplitAxis::Vertical ? "vertical" : "horizontal";
    j["ratio"] = ratio;
    j["left"] = left->toJson();
    j["right"] = right->toJson();
    return j;
  }
};

struct PaneTree::RemoveResult {
  enum Kind {
    // The target was this node; the parent must promote the sibling.
    REMOVED,
    // The target was below this node; `node` replaces it.
    REPLACED,
    // The target is not in this subtree; `node` is handed back unchanged.
    NOT_FOUND,
  };
  Kind kind;
  unique_ptr<Node> node;
};

PaneTree::PaneTree(SessionId initialSession, float _minRatio, float _maxRatio)
    : root(Node::makeLeaf(initialSession)),
      active(initialSession),
      zoomed(false),
      minRatio(_minRatio),
      maxRatio(_maxRatio) {}

PaneTree::~PaneTree() {}

PaneTree::PaneTree(PaneTree &&other) = default;

PaneTree &PaneTree::operator=(PaneTree &&other) = default;

int PaneTree::paneCount() const { return root->paneCount(); }

bool PaneTree::contains(SessionId id) const {
  vector<SessionId> ids = sessionIds();
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool PaneTree::setActive(SessionId id) {
  if (!contains(id)) {
    VLOG(2) << "Ignoring focus on unknown session " << id;
    return false;
  }
  if (id != active) {
    zoomed = false;
  }
  active = id;
  return true;
}

void PaneTree::toggleZoom() { zoomed = !zoomed; }

void PaneTree::splitActive(SplitAxis axis, SessionId newSession) {
  if (contains(newSession)) {
    STFATAL << "Session " << newSession << " is already in the tree";
  }
  if (!root->splitLeaf(active, axis, newSession, &root)) {
    STFATAL << "Active session " << active << " is missing from the tree";
  }
  active = newSession;
  zoomed = false;
}

PaneTree::RemoveResult PaneTree::removeLeaf(unique_ptr<Node> node,
                                            SessionId target) {
  if (node->leaf) {
    if (node->sessionId == target) {
      return RemoveResult{RemoveResult::REMOVED, nullptr};
    }
    return RemoveResult{RemoveResult::NOT_FOUND, std::move(node)};
  }

  RemoveResult fromLeft = removeLeaf(std::move(node->left), target);
  switch (fromLeft.kind) {
    case RemoveResult::REMOVED:
      // The split disappears and the right child takes its place
      return RemoveResult{RemoveResult::REPLACED, std::move(node->right)};
    case RemoveResult::REPLACED:
      node->left = std::move(fromLeft.node);
      return RemoveResult{RemoveResult::REPLACED, std::move(node)};
    case RemoveResult::NOT_FOUND:
      node->left = std::move(fromLeft.node);
      break;
  }

  RemoveResult fromRight = removeLeaf(std::move(node->right), target);
  switch (fromRight.kind) {
    case RemoveResult::REMOVED:
      return RemoveResult{RemoveResult::REPLACED, std::move(node->left)};
    case RemoveResult::REPLACED:
      node->right = std::move(fromRight.node);
      return RemoveResult{RemoveResult::REPLACED, std::move(node)};
    case RemoveResult::NOT_FOUND:
      node->right = std::move(fromRight.node);
      break;
  }
  return RemoveResult{RemoveResult::NOT_FOUND, std::move(node)};
}

bool PaneTree::closeActive() {
  if (paneCount() <= 1) {
    return true;
  }

  vector<SessionId> ids = sessionIds();
  size_t closedIndex =
      std::find(ids.begin(), ids.end(), active) - ids.begin();

  RemoveResult result = removeLeaf(std::move(root), active);
  if (result.kind != RemoveResult::REPLACED) {
    STFATAL << "Active session " << active << " could not be removed";
  }
  root = std::move(result.node);

  // Focus the pane that preceded the closed one, or the first pane
  vector<SessionId> remaining = sessionIds();
  if (closedIndex > 0 && closedIndex <= remaining.size()) {
    active = remaining[closedIndex - 1];
  } else {
    active = remaining[0];
  }
  zoomed = false;
  return false;
}

void PaneTree::focusNext() {
  vector<SessionId> ids = sessionIds();
  if (ids.size() <= 1) {
    return;
  }
  size_t idx = std::find(ids.begin(), ids.end(), active) - ids.begin();
  active = ids[(idx + 1) % ids.size()];
  zoomed = false;
}

void PaneTree::focusPrev() {
  vector<SessionId> ids = sessionIds();
  if (ids.size() <= 1) {
    return;
  }
  size_t idx = std::find(ids.begin(), ids.end(), active) - ids.begin();
  active = (idx == 0) ? ids.back() : ids[idx - 1];
  zoomed = false;
}

vector<SessionId> PaneTree::sessionIds() const {
  vector<SessionId> ids;
  root->collectSessionIds(&ids);
  return ids;
}

vector<PaneLayout> PaneTree::calculateLayouts(float width,
                                              float height) const {
  vector<PaneLayout> layouts;
  if (zoomed) {
    layouts.push_back(PaneLayout{active, 0, 0, width, height});
    return layouts;
  }
  return tiledLayouts(width, height);
}

vector<PaneLayout> PaneTree::tiledLayouts(float width, float height) const {
  vector<PaneLayout> layouts;
  root->calculateLayouts(0, 0, width, height, &layouts);
  return layouts;
}

vector<DividerInfo> PaneTree::collectDividers(float width,
                                              float height) const {
  vector<DividerInfo> dividers;
  DividerPath path;
  root->collectDividers(0, 0, width, height, &path, &dividers);
  return dividers;
}

bool PaneTree::setRatioAt(const DividerPath &path, float ratio) {
  Node *split = root->findSplit(path);
  if (!split) {
    VLOG(2) << "Ignoring ratio update for stale divider path of length "
            << path.size();
    return false;
  }
  split->ratio = std::clamp(ratio, minRatio, maxRatio);
  return true;
}

optional<float> PaneTree::ratioAt(const DividerPath &path) const {
  Node *split = root->findSplit(path);
  if (!split) {
    return nullopt;
  }
  return split->ratio;
}

json PaneTree::toJson() const {
  json tree;
  tree["active"] = active;
  tree["zoomed"] = zoomed;
  tree["root"] = root->toJson();
  return tree;
}
}  // namespace tt
