#include "auton/transport.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace auton {

namespace {

std::string errno_text(const char* what) { return std::string(what) + ": " + std::strerror(errno); }

bool parse_port(const std::string& s, std::uint16_t& out) {
  if (s.empty() || s.size() > 5) return false;
  unsigned long v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
    v = v * 10 + static_cast<unsigned long>(c - '0');
  }
  if (v > 65535) return false;
  out = static_cast<std::uint16_t>(v);
  return true;
}

bool fill_unix_addr(const std::string& path, sockaddr_un& addr, std::string* error) {
  std::memset(&addr, 0, sizeof(addr));
  addr.sun_family = AF_UNIX;
  if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
    if (error) *error = "unix socket path empty or too long";
    return false;
  }
  std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
  return true;
}

// Calls `fn(fd, ai)` for each resolved address until it returns true.
template <typename Fn>
int with_tcp_addresses(const ListenAddress& a, bool passive, Fn fn, std::string* error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  if (passive) hints.ai_flags = AI_PASSIVE;
  addrinfo* res = nullptr;
  const std::string port = std::to_string(a.port);
  const int rc = getaddrinfo(a.host.empty() ? nullptr : a.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    if (error) *error = std::string("getaddrinfo: ") + gai_strerror(rc);
    return -1;
  }
  int out = -1;
  for (addrinfo* it = res; it != nullptr; it = it->ai_next) {
    int fd = ::socket(it->ai_family, it->ai_socktype | SOCK_CLOEXEC, it->ai_protocol);
    if (fd < 0) {
      if (error) *error = errno_text("socket");
      continue;
    }
    if (fn(fd, it)) {
      out = fd;
      break;
    }
    if (error) *error = errno_text(passive ? "bind" : "connect");
    ::close(fd);
  }
  freeaddrinfo(res);
  return out;
}

}  // namespace

// ---------------------------------------------------------------------------
// FdTransport
// ---------------------------------------------------------------------------

FdTransport::FdTransport(int read_fd, int write_fd, bool is_socket, std::string peer,
                         bool owns_fds)
    : read_fd_(read_fd),
      write_fd_(write_fd),
      is_socket_(is_socket),
      owns_(owns_fds),
      peer_(std::move(peer)) {}

FdTransport::~FdTransport() {
  close();
  if (!owns_) return;
  if (read_fd_ >= 0) ::close(read_fd_);
  if (write_fd_ >= 0 && write_fd_ != read_fd_) ::close(write_fd_);
}

long FdTransport::read_some(char* buf, std::size_t len) {
  while (true) {
    const ssize_t n = ::read(read_fd_, buf, len);
    if (n >= 0) return static_cast<long>(n);
    if (errno == EINTR) continue;
    return -1;
  }
}

bool FdTransport::write_all(std::string_view data) {
  std::lock_guard<std::mutex> lk(write_mu_);
  if (closed_) return false;
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t n = is_socket_
                          ? ::send(write_fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL)
                          : ::write(write_fd_, data.data() + off, data.size() - off);
    if (n > 0) {
      off += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    return false;
  }
  return true;
}

void FdTransport::close() {
  std::lock_guard<std::mutex> lk(write_mu_);
  if (closed_) return;
  closed_ = true;
  if (is_socket_) ::shutdown(read_fd_, SHUT_RDWR);
}

std::unique_ptr<Transport> stdio_transport() {
  return std::make_unique<FdTransport>(STDIN_FILENO, STDOUT_FILENO, false, "stdio", false);
}

// ---------------------------------------------------------------------------
// Addresses
// ---------------------------------------------------------------------------

std::string ListenAddress::to_string() const {
  if (kind == Kind::unix_socket) return "unix:" + path;
  if (host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
  return host + ":" + std::to_string(port);
}

std::optional<ListenAddress> parse_listen_address(const std::string& text, std::string* error) {
  ListenAddress a;
  if (text.rfind("unix:", 0) == 0) {
    a.kind = ListenAddress::Kind::unix_socket;
    a.path = text.substr(5);
    if (a.path.empty()) {
      if (error) *error = "unix address needs a path";
      return std::nullopt;
    }
    return a;
  }
  std::string host;
  std::string port;
  if (!text.empty() && text[0] == '[') {
    const auto close = text.find(']');
    if (close == std::string::npos || close + 1 >= text.size() || text[close + 1] != ':') {
      if (error) *error = "bad bracketed address '" + text + "'";
      return std::nullopt;
    }
    host = text.substr(1, close - 1);
    port = text.substr(close + 2);
  } else {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos) {
      if (error) *error = "address '" + text + "' needs host:port or unix:/path";
      return std::nullopt;
    }
    host = text.substr(0, colon);
    port = text.substr(colon + 1);
  }
  if (!parse_port(port, a.port)) {
    if (error) *error = "bad port '" + port + "'";
    return std::nullopt;
  }
  a.host = host.empty() ? "127.0.0.1" : host;
  return a;
}

// ---------------------------------------------------------------------------
// Listener
// ---------------------------------------------------------------------------

std::unique_ptr<Listener> Listener::open(const ListenAddress& address, std::string* error) {
  ListenAddress bound = address;
  int fd = -1;
  if (address.kind == ListenAddress::Kind::unix_socket) {
    sockaddr_un addr;
    if (!fill_unix_addr(address.path, addr, error)) return nullptr;
    fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      if (error) *error = errno_text("socket");
      return nullptr;
    }
    ::unlink(address.path.c_str());
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      if (error) *error = errno_text("bind");
      ::close(fd);
      return nullptr;
    }
  } else {
    fd = with_tcp_addresses(
        address, true,
        [](int s, addrinfo* ai) {
          int one = 1;
          ::setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
          return ::bind(s, ai->ai_addr, ai->ai_addrlen) == 0;
        },
        error);
    if (fd < 0) return nullptr;
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) == 0) {
      if (ss.ss_family == AF_INET) {
        bound.port = ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
      } else if (ss.ss_family == AF_INET6) {
        bound.port = ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
      }
    }
  }
  if (::listen(fd, 64) < 0) {
    if (error) *error = errno_text("listen");
    ::close(fd);
    return nullptr;
  }
  return std::unique_ptr<Listener>(new Listener(fd, std::move(bound)));
}

Listener::~Listener() {
  close();
  ::close(fd_);
  if (address_.kind == ListenAddress::Kind::unix_socket) ::unlink(address_.path.c_str());
}

std::unique_ptr<Transport> Listener::accept(std::string* error) {
  while (true) {
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return nullptr;
    }
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    const int cfd = ::accept4(fd_, reinterpret_cast<sockaddr*>(&ss), &len, SOCK_CLOEXEC);
    if (cfd >= 0) {
      std::string peer = "unix";
      char host[INET6_ADDRSTRLEN] = {0};
      if (ss.ss_family == AF_INET) {
        auto* in = reinterpret_cast<sockaddr_in*>(&ss);
        ::inet_ntop(AF_INET, &in->sin_addr, host, sizeof(host));
        peer = std::string(host) + ":" + std::to_string(ntohs(in->sin_port));
      } else if (ss.ss_family == AF_INET6) {
        auto* in6 = reinterpret_cast<sockaddr_in6*>(&ss);
        ::inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        peer = "[" + std::string(host) + "]:" + std::to_string(ntohs(in6->sin6_port));
      }
      if (ss.ss_family == AF_INET || ss.ss_family == AF_INET6) {
        int one = 1;
        ::setsockopt(cfd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
      }
      return std::make_unique<FdTransport>(cfd, cfd, true, peer);
    }
    if (errno == EINTR || errno == ECONNABORTED) continue;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (closed_) return nullptr;
    }
    if (error) *error = errno_text("accept");
    return nullptr;
  }
}

void Listener::close() {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) return;
  closed_ = true;
  ::shutdown(fd_, SHUT_RDWR);
}

std::unique_ptr<Transport> connect_to(const ListenAddress& address, std::string* error) {
  if (address.kind == ListenAddress::Kind::unix_socket) {
    sockaddr_un addr;
    if (!fill_unix_addr(address.path, addr, error)) return nullptr;
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
      if (error) *error = errno_text("socket");
      return nullptr;
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      if (error) *error = errno_text("connect");
      ::close(fd);
      return nullptr;
    }
    return std::make_unique<FdTransport>(fd, fd, true, address.to_string());
  }
  const int fd = with_tcp_addresses(
      address, false,
      [](int s, addrinfo* ai) { return ::connect(s, ai->ai_addr, ai->ai_addrlen) == 0; }, error);
  if (fd < 0) return nullptr;
  return std::make_unique<FdTransport>(fd, fd, true, address.to_string());
}

}  // namespace auton
