#ifndef __TT_FAKE_PSEUDO_TERMINAL__
#define __TT_FAKE_PSEUDO_TERMINAL__

#include "PseudoTerminal.hpp"

namespace tt {
/**
 * A socketpair standing in for a pty: the session owns one end, the test
 * plays the child on the other.
 */
class FakePseudoTerminal : public PseudoTerminal {
 public:
  FakePseudoTerminal()
      : masterFd(-1),
        peerFd(-1),
        exitCode(0),
        didTerminate(false),
        didHandleSessionEnd(false),
        didCleanUp(false) {}

  virtual ~FakePseudoTerminal() {
    cleanup();
    closePeer();
  }

  virtual int start(const TerminalGeometry& geometry) {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    masterFd = fds[0];
    peerFd = fds[1];
    SetNonBlocking(masterFd);
    lock_guard<mutex> guard(geometryMutex);
    geometries.push_back(geometry);
    return masterFd;
  }

  virtual int getFd() { return masterFd; }

  virtual void setGeometry(const TerminalGeometry& geometry) {
    lock_guard<mutex> guard(geometryMutex);
    geometries.push_back(geometry);
  }

  virtual int handleSessionEnd() {
    didHandleSessionEnd = true;
    return exitCode;
  }

  virtual int terminate(int graceMs) {
    didTerminate = true;
    return exitCode;
  }

  virtual void cleanup() {
    if (masterFd >= 0) {
      ::close(masterFd);
      masterFd = -1;
      didCleanUp = true;
    }
  }

  /** Plays the child writing to its terminal. */
  void writeOutput(const string& s) {
    size_t done = 0;
    while (done < s.size()) {
      ssize_t rc = ::write(peerFd, s.data() + done, s.size() - done);
      FATAL_FAIL(rc);
      done += rc;
    }
  }

  /** Reads what the session sent to the child, waiting up to `timeoutMs`. */
  string readInput(size_t count, int timeoutMs = 5000) {
    string s;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeoutMs);
    while (s.size() < count && std::chrono::steady_clock::now() < deadline) {
      fd_set rfd;
      FD_ZERO(&rfd);
      FD_SET(peerFd, &rfd);
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 10 * 1000;
      if (select(peerFd + 1, &rfd, NULL, NULL, &tv) > 0) {
        char b[1024];
        ssize_t rc = ::read(peerFd, b, min(sizeof(b), count - s.size()));
        if (rc <= 0) {
          break;
        }
        s.append(b, rc);
      }
    }
    return s;
  }

  /** Plays the child exiting: the session sees EOF on its end. */
  void closePeer() {
    if (peerFd >= 0) {
      ::close(peerFd);
      peerFd = -1;
    }
  }

  vector<TerminalGeometry> getGeometries() {
    lock_guard<mutex> guard(geometryMutex);
    return geometries;
  }

  int masterFd;
  int peerFd;
  int exitCode;
  std::atomic<bool> didTerminate;
  std::atomic<bool> didHandleSessionEnd;
  std::atomic<bool> didCleanUp;

 protected:
  mutex geometryMutex;
  vector<TerminalGeometry> geometries;
};

/** Hands out FakePseudoTerminals and keeps them reachable for the test. */
class FakePseudoTerminalFactory : public PseudoTerminalFactory {
 public:
  FakePseudoTerminalFactory() : failNextStart(false) {}

  virtual shared_ptr<PseudoTerminal> create() {
    if (failNextStart) {
      failNextStart = false;
      return shared_ptr<PseudoTerminal>(new FailingPseudoTerminal());
    }
    shared_ptr<FakePseudoTerminal> terminal(new FakePseudoTerminal());
    created.push_back(terminal);
    return terminal;
  }

  /** The fake behind session number `index` in creation order. */
  shared_ptr<FakePseudoTerminal> get(size_t index) { return created.at(index); }

  bool failNextStart;
  vector<shared_ptr<FakePseudoTerminal>> created;

 protected:
  class FailingPseudoTerminal : public FakePseudoTerminal {
   public:
    virtual int start(const TerminalGeometry& geometry) {
      throw std::runtime_error("forkpty failed: Resource temporarily unavailable");
    }
  };
};
}  // namespace tt

#endif  // __TT_FAKE_PSEUDO_TERMINAL__
