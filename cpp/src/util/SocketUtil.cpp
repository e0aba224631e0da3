#include "util/SocketUtil.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace io {

Socket::map_t Socket::map_;
std::mutex Socket::map_mutex_;

Socket* Socket::get_instance(file_descriptor_t fd) {
  std::unique_lock lock(map_mutex_);
  auto it = map_.find(fd);
  if (it == map_.end()) {
    auto* instance = new Socket(fd);
    map_[fd] = instance;
    return instance;
  } else {
    return it->second;
  }
}

bool Socket::read_line(std::string* line, int timeout_ms) {
  std::unique_lock lock(read_mutex_);

  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
  char chunk[256];

  while (true) {
    size_t newline = read_buffer_.find('\n');
    if (newline != std::string::npos) {
      *line = read_buffer_.substr(0, newline);
      read_buffer_.erase(0, newline + 1);
      if (!line->empty() && line->back() == '\r') {
        line->pop_back();
      }
      return true;
    }

    if (timeout_ms > 0) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        throw RelayError("Timed out after {}ms waiting for a line from socket", timeout_ms);
      }

      pollfd pfd{fd_, POLLIN, 0};
      int rc = poll(&pfd, 1, remaining.count());
      if (rc < 0) {
        throw RelayError("poll() failed on socket: {}", std::strerror(errno));
      }
      if (rc == 0) {
        throw RelayError("Timed out after {}ms waiting for a line from socket", timeout_ms);
      }
    }

    int n = recv(fd_, chunk, sizeof(chunk), 0);
    if (n < 0) {
      throw RelayError("Could not read from socket: {}", std::strerror(errno));
    } else if (n == 0) {
      return false;
    }
    read_buffer_.append(chunk, n);
  }
}

void Socket::shutdown() {
  if (active_) {
    ::shutdown(fd_, SHUT_RDWR);
    active_ = false;
  }
}

port_t Socket::get_port() const {
  sockaddr_in addr;
  socklen_t len = sizeof(addr);
  if (getsockname(fd_, (sockaddr*)&addr, &len) < 0) {
    throw util::Exception("getsockname() failed");
  }
  return ntohs(addr.sin_port);
}

Socket* Socket::create_server_socket(io::port_t port, int max_connections) {
  auto fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw util::Exception("Could not create socket");
  }
  const int enable = 1;
  if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &enable, sizeof(int)) < 0) {
    throw util::Exception("setsockopt(SO_REUSEADDR) failed");
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = INADDR_ANY;
  if (bind(fd, (sockaddr*)&addr, sizeof(addr)) < 0) {
    throw util::Exception("Could not bind socket to port {}", port);
  }

  if (listen(fd, max_connections) < 0) {
    throw util::Exception("Could not listen on socket");
  }

  return get_instance(fd);
}

Socket* Socket::create_client_socket(std::string const& host, port_t port) {
  auto fd = socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    throw RelayError("Could not create socket at {}:{}", host, port);
  }

  struct hostent* entry = gethostbyname(host.c_str());
  if (!entry || !entry->h_addr_list[0]) {
    close(fd);
    throw RelayError("Could not resolve host {}", host);
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  std::memcpy(&addr.sin_addr, entry->h_addr_list[0], sizeof(addr.sin_addr));

  int retry_count = 5;
  int sleep_time_ms = 100;
  bool connected = false;
  while (true) {
    if (connect(fd, (sockaddr*)&addr, sizeof(addr)) == 0) {
      connected = true;
      break;
    }
    if (retry_count == 0) break;
    retry_count--;
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_time_ms));
    sleep_time_ms *= 2;
  }
  if (!connected) {
    close(fd);
    throw RelayError("Could not connect to socket at {}:{}", host, port);
  }

  return get_instance(fd);
}

Socket* Socket::accept() const {
  auto fd = ::accept(fd_, nullptr, nullptr);
  if (fd < 0) {
    throw util::Exception("Could not accept connection");
  }

  return get_instance(fd);
}

void Socket::write_helper(const void* data, int size, const char* error_msg) {
  int bytes_sent = 0;
  const char* data_ptr = static_cast<const char*>(data);

  while (bytes_sent < size) {
    int n = send(fd_, data_ptr + bytes_sent, size - bytes_sent, MSG_NOSIGNAL);
    if (n < 0) {
      throw RelayError("{}: {}", error_msg, std::strerror(errno));
    }
    bytes_sent += n;
  }
}

}  // namespace io
