#include "Tab.hpp"

namespace tt {
string sanitizeTitle(const string &title) {
  string s;
  int characters = 0;
  size_t a = 0;
  while (a < title.size() && characters < MAX_TITLE_LENGTH) {
    unsigned char c = title[a];
    size_t length = 1;
    if (c >= 0xF0) {
      length = 4;
    } else if (c >= 0xE0) {
      length = 3;
    } else if (c >= 0xC0) {
      length = 2;
    }
    length = min(length, title.size() - a);
    bool control = false;
    if (length == 1) {
      control = c < 0x20 || c == 0x7F;
    } else if (length == 2 && c == 0xC2) {
      unsigned char next = title[a + 1];
      control = next >= 0x80 && next <= 0x9F;
    }
    if (!control) {
      s.append(title, a, length);
      characters++;
    }
    a += length;
  }
  return s;
}

Tab::Tab(const string &_title, unique_ptr<Session> firstSession,
         float minRatio, float maxRatio)
    : title(_title), tree(firstSession->getId(), minRatio, maxRatio) {
  SessionId id = firstSession->getId();
  sessions.insert(make_pair(id, std::move(firstSession)));
}

Tab::~Tab() {
  shutdownAll();
  // Each Session destructor joins its reader thread
  sessions.clear();
}

Session *Tab::getSession(SessionId id) const {
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second.get();
}

void Tab::shutdownAll() {
  for (auto &it : sessions) {
    it.second->shutdown();
  }
}

json Tab::toJson() const {
  json tab;
  tab["title"] = title;
  tab["panes"] = tree.paneCount();
  tab["tree"] = tree.toJson();
  json running = json::array();
  for (auto &it : sessions) {
    if (it.second->isRunning()) {
      running.push_back(it.first);
    }
  }
  tab["running"] = running;
  return tab;
}
}  // namespace tt
