#include "Session.hpp"

#include "FakePseudoTerminal.hpp"
#include "PtyTerminal.hpp"
#include "TestHeaders.hpp"

using namespace tt;

namespace {
const TerminalGeometry GEOMETRY{80, 24, 8, 16};

bool waitUntil(std::function<bool()> condition, int timeoutMs = 5000) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  while (!condition()) {
    if (std::chrono::steady_clock::now() > deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

optional<SessionEvent> waitForChildExit(SessionEventQueue* events,
                                        int timeoutMs = 5000) {
  optional<SessionEvent> exitEvent;
  waitUntil(
      [events, &exitEvent]() {
        for (const SessionEvent& e : events->poll()) {
          if (e.type == SessionEvent::CHILD_EXIT) {
            exitEvent = e;
          }
        }
        return bool(exitEvent);
      },
      timeoutMs);
  return exitEvent;
}
}  // namespace

TEST_CASE("Child output lands in the shared terminal", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session session(4, fake, GEOMETRY, events, 100, 50);
  REQUIRE(session.getId() == 4);
  REQUIRE(session.isRunning());

  fake->writeOutput("hello\r\nworld");
  auto terminal = session.terminal();
  REQUIRE(waitUntil([terminal]() {
    auto guard = terminal->lock();
    return guard->getBytesProcessed() == 12;
  }));
  {
    auto guard = terminal->lock();
    REQUIRE(guard->visibleLines() == vector<string>{"hello", "world"});
  }

  vector<SessionEvent> received = events->poll();
  REQUIRE(!received.empty());
  REQUIRE(received[0].type == SessionEvent::WAKEUP);
  REQUIRE(received[0].sessionId == 4);
}

TEST_CASE("Input reaches the child", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session session(0, fake, GEOMETRY, events, 100, 50);

  session.sendInput("echo ");
  session.sendInput("hi\n");
  REQUIRE(fake->readInput(8) == "echo hi\n");
}

TEST_CASE("Resize updates the shared state and the child", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session session(0, fake, GEOMETRY, events, 100, 50);

  TerminalGeometry smaller{40, 12, 8, 16};
  session.resize(smaller);
  REQUIRE(session.getGeometry() == smaller);
  {
    auto guard = session.terminal()->lock();
    REQUIRE(guard->getColumns() == 40);
    REQUIRE(guard->getRows() == 12);
  }
  REQUIRE(waitUntil([fake]() { return fake->getGeometries().size() == 2; }));
  REQUIRE(fake->getGeometries()[0] == GEOMETRY);
  REQUIRE(fake->getGeometries()[1] == smaller);

  // An unchanged geometry is not sent again
  session.resize(smaller);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  REQUIRE(fake->getGeometries().size() == 2);
}

TEST_CASE("Resize waits for earlier input", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session session(0, fake, GEOMETRY, events, 100, 50);

  // More than the socket buffers hold while nobody reads the other end
  string input(2 * 1024 * 1024, 'k');
  session.sendInput(input);
  TerminalGeometry wider{120, 24, 8, 16};
  session.resize(wider);

  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  REQUIRE(fake->getGeometries().size() == 1);

  REQUIRE(fake->readInput(input.size(), 10000) == input);
  REQUIRE(waitUntil([fake]() { return fake->getGeometries().size() == 2; }));
  REQUIRE(fake->getGeometries()[1] == wider);
}

TEST_CASE("Shutdown is not held back by a pending resize", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session* session = new Session(0, fake, GEOMETRY, events, 100, 50);

  // The child never reads, so the input stays queued ahead of the resize
  session->sendInput(string(2 * 1024 * 1024, 'p'));
  session->resize(TerminalGeometry{40, 24, 8, 16});
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  shared_ptr<std::atomic<bool>> destroyed(new std::atomic<bool>(false));
  thread destroyer([session, destroyed]() {
    delete session;
    *destroyed = true;
  });
  bool finished = waitUntil([destroyed]() { return bool(*destroyed); }, 3000);
  if (finished) {
    destroyer.join();
  } else {
    destroyer.detach();
  }
  REQUIRE(finished);
  REQUIRE(fake->didTerminate);
  REQUIRE(fake->getGeometries().size() == 1);
}

TEST_CASE("A child that exits on its own is reported", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  fake->exitCode = 3;
  Session session(9, fake, GEOMETRY, events, 100, 50);

  fake->closePeer();
  auto exitEvent = waitForChildExit(events.get());
  REQUIRE(exitEvent.has_value());
  REQUIRE(exitEvent->sessionId == 9);
  REQUIRE(exitEvent->exitCode == 3);
  REQUIRE(waitUntil([&session]() { return !session.isRunning(); }));
  REQUIRE(fake->didHandleSessionEnd);
  REQUIRE(!fake->didTerminate);
  REQUIRE(fake->didCleanUp);
}

TEST_CASE("Destroying a session shuts the child down", "[Session]") {
  shared_ptr<FakePseudoTerminal> fake(new FakePseudoTerminal());
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  {
    Session session(1, fake, GEOMETRY, events, 100, 50);
    session.shutdown();
    session.shutdown();
  }
  REQUIRE(fake->didTerminate);
  REQUIRE(fake->didCleanUp);
  REQUIRE(!fake->didHandleSessionEnd);
  for (const SessionEvent& e : events->poll()) {
    REQUIRE(e.type != SessionEvent::CHILD_EXIT);
  }
}

TEST_CASE("A failed spawn leaves no session behind", "[Session]") {
  shared_ptr<FakePseudoTerminalFactory> factory(
      new FakePseudoTerminalFactory());
  factory->failNextStart = true;
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  unique_ptr<Session> session;
  REQUIRE_THROWS_AS(session.reset(new Session(0, factory->create(), GEOMETRY,
                                              events, 100, 50)),
                    std::runtime_error);
  REQUIRE(!session);
  REQUIRE(events->poll().empty());
}

TEST_CASE("A real shell runs behind a pty", "[Session]") {
  shared_ptr<PtyTerminal> pty(new PtyTerminal("/bin/sh", {}));
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session session(0, pty, GEOMETRY, events, 100, 1000);
  REQUIRE(pty->getPid() > 0);

  session.sendInput("echo tile$((40+2))\n");
  auto terminal = session.terminal();
  REQUIRE(waitUntil([terminal]() {
    auto guard = terminal->lock();
    for (const string& line : guard->visibleLines()) {
      if (line.find("tile42") != string::npos) {
        return true;
      }
    }
    return false;
  }));

  session.sendInput("exit 7\n");
  auto exitEvent = waitForChildExit(events.get());
  REQUIRE(exitEvent.has_value());
  REQUIRE(exitEvent->exitCode == 7);
}

TEST_CASE("A child that closes its terminal and keeps running is hung up on",
          "[Session]") {
  shared_ptr<PtyTerminal> pty(new PtyTerminal(
      "/bin/sh",
      {"-c", "exec </dev/null >/dev/null 2>&1; exec sleep 30"}));
  shared_ptr<SessionEventQueue> events(new SessionEventQueue());
  Session session(0, pty, GEOMETRY, events, 100, 1000);

  auto exitEvent = waitForChildExit(events.get());
  REQUIRE(exitEvent.has_value());
  REQUIRE(exitEvent->exitCode == 128 + SIGHUP);
}
