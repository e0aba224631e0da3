#include "util/SocketUtil.hpp"

namespace io {

inline void Socket::write(const void* data, int size) {
  std::unique_lock lock(write_mutex_);
  write_helper(data, size, "Could not write to socket");
}

inline void Socket::write_line(const std::string& line) {
  std::string buf = line;
  buf += '\n';
  write(buf.data(), buf.size());
}

}  // namespace io
