#include "SessionChannel.hpp"

namespace tt {
SessionChannel::SessionChannel() {
  if (::pipe(wakeFds) == -1) {
    throw std::runtime_error(string("Cannot create session wake pipe: ") +
                             strerror(GetErrno()));
  }
  try {
    SetNonBlocking(wakeFds[0]);
    SetNonBlocking(wakeFds[1]);
  } catch (const std::runtime_error &) {
    ::close(wakeFds[0]);
    ::close(wakeFds[1]);
    throw;
  }
}

SessionChannel::~SessionChannel() {
  ::close(wakeFds[0]);
  ::close(wakeFds[1]);
}

void SessionChannel::sendInput(const string &bytes) {
  if (bytes.empty()) {
    return;
  }
  push(SessionMessage{SessionMessage::INPUT, bytes, TerminalGeometry()});
}

void SessionChannel::sendResize(const TerminalGeometry &geometry) {
  push(SessionMessage{SessionMessage::RESIZE, string(), geometry});
}

void SessionChannel::sendShutdown() {
  push(SessionMessage{SessionMessage::SHUTDOWN, string(), TerminalGeometry()});
}

void SessionChannel::push(SessionMessage message) {
  {
    lock_guard<mutex> guard(queueMutex);
    queue.push_back(std::move(message));
  }
  char wake = 1;
  // A full pipe already guarantees a pending wakeup
  if (::write(wakeFds[1], &wake, 1) == -1 && GetErrno() != EAGAIN &&
      GetErrno() != EWOULDBLOCK) {
    STERROR << "Cannot wake session thread: " << strerror(GetErrno());
  }
}

deque<SessionMessage> SessionChannel::drain() {
  char b[64];
  while (::read(wakeFds[0], b, sizeof(b)) > 0) {
  }
  deque<SessionMessage> messages;
  lock_guard<mutex> guard(queueMutex);
  messages.swap(queue);
  return messages;
}

size_t SessionChannel::pending() {
  lock_guard<mutex> guard(queueMutex);
  return queue.size();
}
}  // namespace tt
