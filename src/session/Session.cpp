#include "Session.hpp"

#include "LogHandler.hpp"

namespace tt {
#define BUF_SIZE (16 * 1024)

Session::Session(SessionId _id, shared_ptr<PseudoTerminal> _pty,
                 const TerminalGeometry &_geometry,
                 shared_ptr<SessionEventQueue> _events, int historyLines,
                 int _shutdownGraceMs)
    : id(_id),
      pty(_pty),
      geometry(_geometry),
      events(_events),
      shutdownGraceMs(_shutdownGraceMs),
      state(new SharedTerminal(_geometry.columns, _geometry.rows,
                               historyLines)),
      shutdownRequested(false),
      shutdownSent(false),
      running(false) {
  pty->start(geometry);
  running = true;
  readerThread.reset(new thread(&Session::run, this));
  VLOG(1) << "Session " << id << " started at " << geometry;
}

Session::~Session() {
  shutdown();
  join();
}

void Session::sendInput(const string &bytes) { channel.sendInput(bytes); }

void Session::resize(const TerminalGeometry &newGeometry) {
  if (newGeometry == geometry) {
    return;
  }
  geometry = newGeometry;
  {
    auto guard = state->lock();
    guard->resize(geometry.columns, geometry.rows);
  }
  channel.sendResize(geometry);
  VLOG(2) << "Session " << id << " resized to " << geometry;
}

void Session::shutdown() {
  if (shutdownSent) {
    return;
  }
  shutdownSent = true;
  channel.sendShutdown();
}

void Session::join() {
  if (readerThread && readerThread->joinable()) {
    VLOG(1) << "Joining session " << id;
    readerThread->join();
    VLOG(1) << "Session " << id << " joined";
  }
}

void Session::applyBacklog(WriteBuffer *pending) {
  // Shutdown overtakes anything still waiting, including a resize held back
  // by input the child never reads
  for (const SessionMessage &message : backlog) {
    if (message.type == SessionMessage::SHUTDOWN) {
      shutdownRequested = true;
      backlog.clear();
      return;
    }
  }
  while (!backlog.empty()) {
    SessionMessage &message = backlog.front();
    switch (message.type) {
      case SessionMessage::INPUT:
        pending->push(message.bytes);
        break;
      case SessionMessage::RESIZE:
        if (!pending->empty()) {
          return;
        }
        pty->setGeometry(message.geometry);
        break;
      case SessionMessage::SHUTDOWN:
        shutdownRequested = true;
        backlog.clear();
        return;
    }
    backlog.pop_front();
  }
}

bool Session::readOutput(int masterFd) {
  char b[BUF_SIZE];
  ssize_t rc = ::read(masterFd, b, BUF_SIZE);
  if (rc > 0) {
    VLOG(4) << "Session " << id << " read " << rc << " bytes";
    {
      auto guard = state->lock();
      guard->applyOutput(string(b, rc));
    }
    events->push(SessionEvent{SessionEvent::WAKEUP, id, 0});
    return true;
  }
  int readErrno = GetErrno();  // Save errno before any logging
  if (rc < 0 && (readErrno == EAGAIN || readErrno == EWOULDBLOCK ||
                 readErrno == EINTR)) {
    return true;
  }
  if (rc == 0 || readErrno == EIO) {
    // Linux reports EIO on the master once the slave side is closed
    LOG(INFO) << "Terminal session " << id << " ended";
  } else {
    LOG(ERROR) << "Terminal read error on session " << id << ": "
               << strerror(readErrno);
  }
  return false;
}

void Session::run() {
  LogHandler::nameSessionThread(id);
  int masterFd = pty->getFd();
  int wakeFd = channel.getWakeFd();
  WriteBuffer pending;
  bool childExited = false;

  try {
    while (!shutdownRequested) {
      fd_set rfd;
      fd_set wfd;
      FD_ZERO(&rfd);
      FD_ZERO(&wfd);
      FD_SET(wakeFd, &rfd);
      if (!pending.overHighWaterMark()) {
        FD_SET(masterFd, &rfd);
      }
      if (!pending.empty()) {
        FD_SET(masterFd, &wfd);
      }
      timeval tv;
      tv.tv_sec = 0;
      tv.tv_usec = 100 * 1000;
      int rc = select(max(masterFd, wakeFd) + 1, &rfd, &wfd, NULL, &tv);
      if (rc == -1) {
        if (GetErrno() == EINTR) {
          continue;
        }
        throw std::runtime_error(string("select failed: ") +
                                 strerror(GetErrno()));
      }

      if (FD_ISSET(wakeFd, &rfd)) {
        deque<SessionMessage> messages = channel.drain();
        for (auto &message : messages) {
          backlog.push_back(std::move(message));
        }
        applyBacklog(&pending);
        if (shutdownRequested) {
          break;
        }
      }

      if (FD_ISSET(masterFd, &wfd)) {
        pending.flushTo(masterFd);
        applyBacklog(&pending);
      }

      if (FD_ISSET(masterFd, &rfd) && !readOutput(masterFd)) {
        childExited = true;
        break;
      }
    }
  } catch (const std::exception &ex) {
    LOG(ERROR) << "Session " << id << " stopped: " << ex.what();
    childExited = !shutdownRequested;
  }

  int exitCode = 0;
  if (childExited) {
    exitCode = pty->handleSessionEnd();
  } else {
    exitCode = pty->terminate(shutdownGraceMs);
  }
  pty->cleanup();
  running = false;
  LOG(INFO) << "Session " << id << " finished with exit code " << exitCode;

  // A requested shutdown is already known to the UI; only report exits the
  // child decided on its own.
  if (childExited) {
    events->push(SessionEvent{SessionEvent::CHILD_EXIT, id, exitCode});
  }
}
}  // namespace tt
