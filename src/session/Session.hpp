#ifndef __TT_SESSION__
#define __TT_SESSION__

#include "Headers.hpp"
#include "PseudoTerminal.hpp"
#include "SessionChannel.hpp"
#include "SessionEvents.hpp"
#include "SessionId.hpp"
#include "TerminalState.hpp"
#include "WriteBuffer.hpp"

namespace tt {
/**
 * @brief One pane's child process, its shared terminal state and the thread
 * that feeds it.
 *
 * The reader thread is the only writer of incoming output; the UI thread
 * talks to the child exclusively through the non-blocking channel.
 * Destroying a Session sends a shutdown request and joins the thread, so
 * the shared state never outlives the thread that writes it.
 */
class Session {
 public:
  /**
   * @brief Starts the child and the reader thread.
   * @throws std::runtime_error if the child could not be created; no thread
   * is running in that case.
   */
  Session(SessionId _id, shared_ptr<PseudoTerminal> _pty,
          const TerminalGeometry &_geometry,
          shared_ptr<SessionEventQueue> _events, int historyLines,
          int _shutdownGraceMs);
  ~Session();
  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  inline SessionId getId() const { return id; }
  /** @brief Handle to the shared terminal state, for the renderer. */
  inline shared_ptr<SharedTerminal> terminal() const { return state; }
  inline const TerminalGeometry &getGeometry() const { return geometry; }
  /** @brief False once the reader thread has finished. */
  inline bool isRunning() const { return running; }

  /** @brief Queues bytes for the child without blocking. */
  void sendInput(const string &bytes);

  /**
   * @brief Resizes the shared state and queues a window size change.
   *
   * Resizes reach the child after any input sent before them.
   */
  void resize(const TerminalGeometry &newGeometry);

  /** @brief First half of teardown: asks the thread to stop the child. */
  void shutdown();

  /** @brief Second half of teardown: waits for the thread to finish. */
  void join();

 protected:
  void run();
  /** @brief Applies queued messages in order; stops at a resize while input
   * is still pending so the child sees them in the order they were sent. */
  void applyBacklog(WriteBuffer *pending);
  /** @brief Reads one chunk of child output. @return false at EOF/error. */
  bool readOutput(int masterFd);

  SessionId id;
  shared_ptr<PseudoTerminal> pty;
  TerminalGeometry geometry;
  shared_ptr<SessionEventQueue> events;
  int shutdownGraceMs;
  shared_ptr<SharedTerminal> state;
  SessionChannel channel;
  /** @brief Messages drained from the channel but not yet applied. */
  deque<SessionMessage> backlog;
  bool shutdownRequested;
  bool shutdownSent;
  std::atomic<bool> running;
  unique_ptr<thread> readerThread;
};
}  // namespace tt

#endif  // __TT_SESSION__
