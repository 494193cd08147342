#include "SessionChannel.hpp"

#include "TestHeaders.hpp"

using namespace tt;

namespace {
bool wakeFdReadable(int fd) {
  fd_set rfd;
  FD_ZERO(&rfd);
  FD_SET(fd, &rfd);
  timeval tv;
  tv.tv_sec = 0;
  tv.tv_usec = 0;
  return select(fd + 1, &rfd, NULL, NULL, &tv) > 0;
}
}  // namespace

TEST_CASE("Messages arrive in the order they were sent", "[SessionChannel]") {
  SessionChannel channel;
  REQUIRE(!wakeFdReadable(channel.getWakeFd()));

  channel.sendInput("ls\n");
  channel.sendResize(TerminalGeometry{100, 30, 8, 16});
  channel.sendInput("pwd\n");
  channel.sendShutdown();
  REQUIRE(channel.pending() == 4);
  REQUIRE(wakeFdReadable(channel.getWakeFd()));

  deque<SessionMessage> messages = channel.drain();
  REQUIRE(messages.size() == 4);
  REQUIRE(messages[0].type == SessionMessage::INPUT);
  REQUIRE(messages[0].bytes == "ls\n");
  REQUIRE(messages[1].type == SessionMessage::RESIZE);
  REQUIRE(messages[1].geometry == TerminalGeometry{100, 30, 8, 16});
  REQUIRE(messages[2].bytes == "pwd\n");
  REQUIRE(messages[3].type == SessionMessage::SHUTDOWN);

  REQUIRE(channel.pending() == 0);
  REQUIRE(!wakeFdReadable(channel.getWakeFd()));
  REQUIRE(channel.drain().empty());
}

TEST_CASE("Empty input is dropped", "[SessionChannel]") {
  SessionChannel channel;
  channel.sendInput("");
  REQUIRE(channel.pending() == 0);
}

TEST_CASE("Sending never blocks on a full wake pipe", "[SessionChannel]") {
  SessionChannel channel;
  // Far more wake bytes than a pipe buffer holds
  for (int a = 0; a < 200000; a++) {
    channel.sendInput("x");
  }
  REQUIRE(channel.pending() == 200000);
  REQUIRE(channel.drain().size() == 200000);
  REQUIRE(!wakeFdReadable(channel.getWakeFd()));
}
