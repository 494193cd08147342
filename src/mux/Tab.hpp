#ifndef __TT_TAB__
#define __TT_TAB__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PaneTree.hpp"
#include "Session.hpp"

namespace tt {
/** @brief Longest tab title kept, in characters. */
const int MAX_TITLE_LENGTH = 256;

/**
 * @brief Drops control characters (C0, DEL and C1) and keeps at most
 * `MAX_TITLE_LENGTH` UTF-8 characters.
 */
string sanitizeTitle(const string &title);

/** @brief One tab: a split tree and the sessions behind its leaves. */
class Tab {
 public:
  Tab(const string &_title, unique_ptr<Session> firstSession, float minRatio,
      float maxRatio);
  /** @brief Signals every session before joining any of them. */
  ~Tab();

  /** @brief Returns the session behind a leaf, or nullptr. */
  Session *getSession(SessionId id) const;
  inline bool ownsSession(SessionId id) const {
    return sessions.find(id) != sessions.end();
  }
  /** @brief Starts shutdown of every session without waiting. */
  void shutdownAll();

  json toJson() const;

  string title;
  PaneTree tree;
  map<SessionId, unique_ptr<Session>> sessions;
};
}  // namespace tt

#endif  // __TT_TAB__
