#ifndef __TT_WRITE_BUFFER__
#define __TT_WRITE_BUFFER__

#include "Headers.hpp"

namespace tt {
/**
 * @brief Input bytes waiting to be written to a pseudo-terminal master.
 *
 * The session thread never blocks on the child: keystrokes are queued here and
 * flushed whenever `select()` reports the master descriptor writable.  While
 * the buffer is above `HIGH_WATER_MARK` the session stops reading child
 * output, which lets the kernel's pty buffers push back on the child instead
 * of the UI.
 */
class WriteBuffer {
 public:
  static constexpr size_t HIGH_WATER_MARK = 256 * 1024;

  WriteBuffer() : totalBytes(0), frontOffset(0) {}

  bool empty() const { return chunks.empty(); }

  size_t size() const { return totalBytes; }

  bool overHighWaterMark() const { return totalBytes >= HIGH_WATER_MARK; }

  void push(const string &data) {
    if (data.empty()) return;
    chunks.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Writes as much as the descriptor accepts without blocking.
   * @return The number of bytes written.
   * @throws std::runtime_error when the descriptor reports a hard error.
   */
  size_t flushTo(int fd) {
    size_t written = 0;
    while (!chunks.empty()) {
      const string &front = chunks.front();
      ssize_t rc = ::write(fd, front.data() + frontOffset,
                           front.size() - frontOffset);
      if (rc < 0) {
        int localErrno = GetErrno();
        if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
            localErrno == EINTR) {
          break;
        }
        throw std::runtime_error(string("Cannot write to terminal: ") +
                                 strerror(localErrno));
      }
      if (rc == 0) {
        break;
      }
      written += rc;
      advance(rc);
    }
    return written;
  }

  void clear() {
    chunks.clear();
    totalBytes = 0;
    frontOffset = 0;
  }

 private:
  void advance(size_t count) {
    while (count > 0 && !chunks.empty()) {
      size_t available = chunks.front().size() - frontOffset;
      if (count >= available) {
        count -= available;
        totalBytes -= available;
        frontOffset = 0;
        chunks.pop_front();
      } else {
        frontOffset += count;
        totalBytes -= count;
        count = 0;
      }
    }
  }

  std::deque<string> chunks;
  size_t totalBytes;
  // Offset into the front chunk after a partial write
  size_t frontOffset;
};
}  // namespace tt

#endif  // __TT_WRITE_BUFFER__
