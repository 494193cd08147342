#include "WriteBuffer.hpp"

#include "TestHeaders.hpp"

using namespace tt;

namespace {
string readAvailable(int fd) {
  string s;
  char b[4096];
  while (true) {
    ssize_t rc = ::read(fd, b, sizeof(b));
    if (rc <= 0) {
      break;
    }
    s.append(b, rc);
  }
  return s;
}
}  // namespace

TEST_CASE("WriteBuffer basic operations", "[WriteBuffer]") {
  WriteBuffer buffer;

  SECTION("Empty buffer state") {
    REQUIRE(buffer.empty());
    REQUIRE(buffer.size() == 0);
    REQUIRE(!buffer.overHighWaterMark());
  }

  SECTION("Empty input is not queued") {
    buffer.push("");
    REQUIRE(buffer.empty());
  }

  SECTION("Sizes add up across chunks") {
    buffer.push("abc");
    buffer.push("defgh");
    REQUIRE(!buffer.empty());
    REQUIRE(buffer.size() == 8);
  }

  SECTION("Clear buffer") {
    buffer.push("hello");
    buffer.push("world");
    buffer.clear();
    REQUIRE(buffer.empty());
    REQUIRE(buffer.size() == 0);
  }

  SECTION("High water mark") {
    buffer.push(string(WriteBuffer::HIGH_WATER_MARK - 1, 'x'));
    REQUIRE(!buffer.overHighWaterMark());
    buffer.push("y");
    REQUIRE(buffer.overHighWaterMark());
  }
}

TEST_CASE("WriteBuffer flushes in order", "[WriteBuffer]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  SetNonBlocking(fds[0]);
  SetNonBlocking(fds[1]);

  WriteBuffer buffer;
  buffer.push("echo ");
  buffer.push("hello");
  buffer.push("\n");
  REQUIRE(buffer.flushTo(fds[1]) == 11);
  REQUIRE(buffer.empty());
  REQUIRE(readAvailable(fds[0]) == "echo hello\n");

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("WriteBuffer keeps what a full descriptor refuses",
          "[WriteBuffer]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  SetNonBlocking(fds[0]);
  SetNonBlocking(fds[1]);

  string payload(1024 * 1024, '\0');
  for (size_t a = 0; a < payload.size(); a++) {
    payload[a] = 'A' + rand() % 26;
  }
  WriteBuffer buffer;
  buffer.push(payload.substr(0, 300 * 1024));
  buffer.push(payload.substr(300 * 1024));

  // A pipe holds far less than a megabyte, so the first flush is partial
  size_t written = buffer.flushTo(fds[1]);
  REQUIRE(written > 0);
  REQUIRE(written < payload.size());
  REQUIRE(buffer.size() == payload.size() - written);

  string received;
  while (!buffer.empty()) {
    received += readAvailable(fds[0]);
    buffer.flushTo(fds[1]);
  }
  received += readAvailable(fds[0]);
  REQUIRE(received == payload);

  ::close(fds[0]);
  ::close(fds[1]);
}

TEST_CASE("WriteBuffer reports a closed reader", "[WriteBuffer]") {
  int fds[2];
  FATAL_FAIL(::pipe(fds));
  SetNonBlocking(fds[1]);
  ::close(fds[0]);

  WriteBuffer buffer;
  buffer.push("lost");
  REQUIRE_THROWS_AS(buffer.flushTo(fds[1]), std::runtime_error);
  REQUIRE(buffer.size() == 4);
  ::close(fds[1]);
}
