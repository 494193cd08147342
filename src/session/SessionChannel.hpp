#ifndef __TT_SESSION_CHANNEL__
#define __TT_SESSION_CHANNEL__

#include "Headers.hpp"
#include "TerminalGeometry.hpp"

namespace tt {
/** @brief One request from the UI thread to a session thread. */
struct SessionMessage {
  enum Type {
    INPUT,
    RESIZE,
    SHUTDOWN,
  };
  Type type;
  string bytes;
  TerminalGeometry geometry;
};

/**
 * @brief Non-blocking FIFO from the UI thread to one session thread.
 *
 * Messages are delivered in the order they were sent.  A self-pipe wakes the
 * session thread out of `select()`; `getWakeFd()` is the read side to poll.
 */
class SessionChannel {
 public:
  /** @throws std::runtime_error if the wake pipe cannot be created. */
  SessionChannel();
  ~SessionChannel();
  SessionChannel(const SessionChannel &) = delete;
  SessionChannel &operator=(const SessionChannel &) = delete;

  void sendInput(const string &bytes);
  void sendResize(const TerminalGeometry &geometry);
  void sendShutdown();

  inline int getWakeFd() const { return wakeFds[0]; }

  /** @brief Takes every queued message and clears the wake pipe. */
  deque<SessionMessage> drain();

  /** @brief Number of messages not yet drained. */
  size_t pending();

 protected:
  void push(SessionMessage message);

  mutex queueMutex;
  deque<SessionMessage> queue;
  int wakeFds[2];
};
}  // namespace tt

#endif  // __TT_SESSION_CHANNEL__
