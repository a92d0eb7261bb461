#pragma once

// auton/transport.hpp: Ordered reliable byte streams between front-end and
// executor.
//
// The orchestrator only needs read_some/write_all/close. FdTransport wraps a
// connected socket or a pair of pipe descriptors (stdio mode). Writes are
// serialised internally because session runners and connection readers
// both write to the same peer. close() unblocks a reader parked in
// read_some() on sockets.
//
// Listen addresses:
//   "host:port"        TCP (port 0 picks an ephemeral port)
//   "unix:/path/sock"  Unix domain socket

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace auton {

class Transport {
 public:
  virtual ~Transport() = default;

  // Blocks. Returns bytes read, 0 on EOF, -1 on error.
  virtual long read_some(char* buf, std::size_t len) = 0;
  virtual bool write_all(std::string_view data) = 0;
  virtual void close() = 0;
  virtual std::string peer() const = 0;
};

class FdTransport : public Transport {
 public:
  // Takes ownership of both descriptors (they may be the same socket)
  // unless owns_fds is false.
  FdTransport(int read_fd, int write_fd, bool is_socket, std::string peer, bool owns_fds = true);
  ~FdTransport() override;

  FdTransport(const FdTransport&) = delete;
  FdTransport& operator=(const FdTransport&) = delete;

  long read_some(char* buf, std::size_t len) override;
  bool write_all(std::string_view data) override;
  void close() override;
  std::string peer() const override { return peer_; }

 private:
  int read_fd_;
  int write_fd_;
  bool is_socket_;
  bool owns_;
  std::string peer_;
  std::mutex write_mu_;
  bool closed_{false};
};

// Non-owning transport over stdin/stdout.
std::unique_ptr<Transport> stdio_transport();

struct ListenAddress {
  enum class Kind { tcp, unix_socket };
  Kind kind{Kind::tcp};
  std::string host;
  std::uint16_t port{0};
  std::string path;

  std::string to_string() const;
};

std::optional<ListenAddress> parse_listen_address(const std::string& text, std::string* error);

class Listener {
 public:
  static std::unique_ptr<Listener> open(const ListenAddress& address, std::string* error);
  ~Listener();

  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

  // Blocks. Returns nullptr once close() was called or on a fatal error.
  std::unique_ptr<Transport> accept(std::string* error);
  void close();

  // Address actually bound (ephemeral TCP ports resolved).
  const ListenAddress& address() const { return address_; }

 private:
  Listener(int fd, ListenAddress address) : fd_(fd), address_(std::move(address)) {}

  int fd_;
  ListenAddress address_;
  std::mutex mu_;
  bool closed_{false};
};

std::unique_ptr<Transport> connect_to(const ListenAddress& address, std::string* error);

}  // namespace auton
