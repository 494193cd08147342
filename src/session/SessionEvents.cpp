#include "SessionEvents.hpp"

namespace tt {
void SessionEventQueue::push(const SessionEvent &event) {
  {
    lock_guard<mutex> guard(eventMutex);
    if (event.type == SessionEvent::WAKEUP && !events.empty() &&
        events.back().type == SessionEvent::WAKEUP &&
        events.back().sessionId == event.sessionId) {
      return;
    }
    events.push_back(event);
  }
  eventReady.notify_all();
}

vector<SessionEvent> SessionEventQueue::poll() {
  vector<SessionEvent> drained;
  lock_guard<mutex> guard(eventMutex);
  drained.swap(events);
  return drained;
}

bool SessionEventQueue::waitFor(std::chrono::milliseconds timeout) {
  unique_lock<mutex> lk(eventMutex);
  return eventReady.wait_for(lk, timeout, [this] { return !events.empty(); });
}
}  // namespace tt
