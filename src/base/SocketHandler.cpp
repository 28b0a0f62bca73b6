#include "SocketHandler.hpp"

namespace devlink {
const std::chrono::seconds SocketHandler::WRITE_STALL_TIMEOUT(10);

bool SocketHandler::writeAll(int fd, const void* buf, size_t count) {
  const char* data = static_cast<const char*>(buf);
  size_t pos = 0;
  auto lastProgress = std::chrono::steady_clock::now();
  while (pos < count) {
    ssize_t written = write(fd, data + pos, count - pos);
    if (written > 0) {
      pos += written;
      lastProgress = std::chrono::steady_clock::now();
      continue;
    }
    if (written < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
      VLOG(1) << "Write to fd " << fd << " failed: " << strerror(errno);
      return false;
    }
    if (std::chrono::steady_clock::now() - lastProgress > WRITE_STALL_TIMEOUT) {
      LOG(WARNING) << "Write to fd " << fd << " stalled, giving up";
      return false;
    }
    VLOG(2) << "fd " << fd << " is full, waiting";
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}
}  // namespace devlink
