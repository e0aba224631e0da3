#pragma once

#include "util/Exception.hpp"

#include <map>
#include <mutex>
#include <string>

namespace io {

using file_descriptor_t = int;
using port_t = int;

/*
 * Raised when the connection to a relay peer fails: it could not be established, it was lost, or
 * the peer did not answer within the allotted time. Fatal to the current game only.
 */
class RelayError : public util::Exception {
 public:
  using util::Exception::Exception;
};

/*
 * Provides thread-safe access to a socket that carries newline-terminated text lines.
 *
 * The main methods are write_line() and read_line(). These are thread-safe and loop until all
 * requested bytes are written/read.
 *
 * Example usage:
 *
 * Socket* socket = Socket::create_client_socket(host, port);
 * socket->write_line("game-17");
 *
 * std::string line;
 * if (!socket->read_line(&line, 5000)) {
 *   // peer closed the connection
 * }
 */
class Socket {
 public:
  using map_t = std::map<file_descriptor_t, Socket*>;

  static Socket* get_instance(file_descriptor_t fd);

  /*
   * Thread-safe write to socket. Loops until size bytes are written.
   */
  void write(const void* data, int size);

  /*
   * Appends a '\n' to line and writes it.
   */
  void write_line(const std::string& line);

  /*
   * Thread-safe read of one line, without its terminating "\n" or "\r\n".
   *
   * If the socket has been closed before a full line arrived, returns false.
   *
   * If timeout_ms is positive and no full line arrives within timeout_ms milliseconds, throws
   * RelayError. A non-positive timeout_ms waits indefinitely.
   */
  bool read_line(std::string* line, int timeout_ms = 0);

  void shutdown();

  // The port the socket is bound to. Useful after binding to port 0.
  port_t get_port() const;

  static Socket* create_server_socket(port_t port, int max_connections);
  static Socket* create_client_socket(std::string const& host, port_t port);
  Socket* accept() const;

 private:
  Socket(file_descriptor_t fd) : fd_(fd) {}
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  void write_helper(const void* data, int size, const char* error_msg);

  static map_t map_;
  static std::mutex map_mutex_;

  mutable std::mutex write_mutex_;
  mutable std::mutex read_mutex_;
  const file_descriptor_t fd_;
  std::string read_buffer_;
  bool active_ = true;
};

}  // namespace io

#include "inline/util/SocketUtil.inl"
