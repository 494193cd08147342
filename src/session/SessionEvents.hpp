#ifndef __TT_SESSION_EVENTS__
#define __TT_SESSION_EVENTS__

#include "Headers.hpp"
#include "SessionId.hpp"

namespace tt {
/** @brief Notification from a session thread to the UI thread. */
struct SessionEvent {
  enum Type {
    /** @brief New output was applied to the session's terminal state. */
    WAKEUP,
    /** @brief The child process exited on its own. */
    CHILD_EXIT,
  };
  Type type;
  SessionId sessionId;
  int exitCode;
};

/**
 * @brief Thread-safe queue of session events, drained by the UI thread.
 *
 * Consecutive wakeups from the same session are coalesced since they only
 * ask for a redraw.
 */
class SessionEventQueue {
 public:
  void push(const SessionEvent &event);

  /** @brief Takes every pending event without blocking. */
  vector<SessionEvent> poll();

  /** @brief Blocks up to `timeout` for at least one event. */
  bool waitFor(std::chrono::milliseconds timeout);

 protected:
  mutex eventMutex;
  condition_variable eventReady;
  vector<SessionEvent> events;
};
}  // namespace tt

#endif  // __TT_SESSION_EVENTS__
