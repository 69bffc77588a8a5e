#include "endpoint.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "errors.hpp"
#include "transport/fd_stream.hpp"

namespace transport {

using frame_relay::TransportError;

static std::string errno_str(const char *what) {
  return std::string(what) + ": " + std::strerror(errno);
}

std::string Endpoint::to_string() const {
  switch (kind) {
  case EndpointKind::Unix:
    return "unix:" + path;
  case EndpointKind::Tcp:
    return "tcp:" + host + ":" + std::to_string(port);
  case EndpointKind::Fifo:
    return "fifo:" + path;
  }
  return "?";
}

Endpoint parse_endpoint(const std::string &text) {
  const auto colon = text.find(':');
  if (colon == std::string::npos) {
    throw std::runtime_error("Invalid endpoint '" + text +
                             "'. Expected unix:<path>, tcp:<host>:<port> or "
                             "fifo:<path>");
  }

  const std::string scheme = text.substr(0, colon);
  const std::string rest = text.substr(colon + 1);

  Endpoint ep;
  if (scheme == "unix" || scheme == "fifo") {
    if (rest.empty()) {
      throw std::runtime_error("Invalid endpoint '" + text + "': empty path");
    }
    ep.kind = scheme == "unix" ? EndpointKind::Unix : EndpointKind::Fifo;
    ep.path = rest;
    if (ep.kind == EndpointKind::Unix &&
        ep.path.size() >= sizeof(sockaddr_un{}.sun_path)) {
      throw std::runtime_error("Invalid endpoint '" + text +
                               "': socket path too long");
    }
    return ep;
  }

  if (scheme == "tcp") {
    const auto port_sep = rest.rfind(':');
    if (port_sep == std::string::npos || port_sep == 0 ||
        port_sep + 1 >= rest.size()) {
      throw std::runtime_error("Invalid endpoint '" + text +
                               "': expected tcp:<host>:<port>");
    }
    ep.kind = EndpointKind::Tcp;
    ep.host = rest.substr(0, port_sep);
    int port = 0;
    try {
      std::size_t used = 0;
      port = std::stoi(rest.substr(port_sep + 1), &used);
      if (used != rest.size() - port_sep - 1) {
        throw std::invalid_argument("trailing characters");
      }
    } catch (const std::exception &) {
      throw std::runtime_error("Invalid endpoint '" + text + "': bad port");
    }
    if (port <= 0 || port > 65535) {
      throw std::runtime_error("Invalid endpoint '" + text +
                               "': port out of range");
    }
    ep.port = static_cast<uint16_t>(port);
    return ep;
  }

  throw std::runtime_error("Invalid endpoint scheme '" + scheme +
                           "'. Valid values: unix, tcp, fifo");
}

static sockaddr_un make_unix_addr(const std::string &path) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  return addr;
}

static addrinfo *resolve_tcp(const Endpoint &ep, bool passive,
                             std::string &err) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  if (passive) {
    hints.ai_flags = AI_PASSIVE;
  }
  addrinfo *res = nullptr;
  const std::string port = std::to_string(ep.port);
  const int rc = ::getaddrinfo(ep.host.c_str(), port.c_str(), &hints, &res);
  if (rc != 0) {
    err = "getaddrinfo(" + ep.host + "): " + ::gai_strerror(rc);
    return nullptr;
  }
  return res;
}

std::unique_ptr<ByteStream> connect_endpoint(const Endpoint &endpoint,
                                             std::chrono::milliseconds idle_timeout,
                                             std::string &err) {
  err.clear();

  switch (endpoint.kind) {
  case EndpointKind::Unix: {
    const int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) {
      err = errno_str("socket");
      return nullptr;
    }
    const sockaddr_un addr = make_unix_addr(endpoint.path);
    if (::connect(fd, reinterpret_cast<const sockaddr *>(&addr),
                  sizeof(addr)) < 0) {
      err = errno_str(("connect " + endpoint.to_string()).c_str());
      ::close(fd);
      return nullptr;
    }
    return std::make_unique<FdStream>(fd, true, endpoint.to_string(),
                                      idle_timeout);
  }

  case EndpointKind::Tcp: {
    addrinfo *res = resolve_tcp(endpoint, false, err);
    if (!res) {
      return nullptr;
    }
    int fd = -1;
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
      fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (fd < 0) {
        continue;
      }
      if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
        break;
      }
      err = errno_str(("connect " + endpoint.to_string()).c_str());
      ::close(fd);
      fd = -1;
    }
    ::freeaddrinfo(res);
    if (fd < 0) {
      if (err.empty()) {
        err = "connect " + endpoint.to_string() + ": no usable address";
      }
      return nullptr;
    }
    int yes = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
    return std::make_unique<FdStream>(fd, true, endpoint.to_string(),
                                      idle_timeout);
  }

  case EndpointKind::Fifo: {
    // Non-blocking open fails with ENXIO while no reader is present, which
    // lets the caller's backoff loop handle it like a refused connection.
    const int fd = ::open(endpoint.path.c_str(), O_WRONLY | O_NONBLOCK);
    if (fd < 0) {
      err = errno_str(("open " + endpoint.to_string()).c_str());
      return nullptr;
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    ::fcntl(fd, F_SETFL, flags & ~O_NONBLOCK);
    return std::make_unique<FdStream>(fd, false, endpoint.to_string(),
                                      idle_timeout);
  }
  }

  err = "unsupported endpoint";
  return nullptr;
}

StreamListener::StreamListener(const Endpoint &endpoint,
                               std::chrono::milliseconds idle_timeout)
    : endpoint_(endpoint), idle_timeout_(idle_timeout) {
  switch (endpoint_.kind) {
  case EndpointKind::Unix: {
    listen_fd_ = ::socket(AF_UNIX, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
      throw TransportError(errno_str("socket"));
    }
    ::unlink(endpoint_.path.c_str());
    const sockaddr_un addr = make_unix_addr(endpoint_.path);
    if (::bind(listen_fd_, reinterpret_cast<const sockaddr *>(&addr),
               sizeof(addr)) < 0) {
      const std::string msg = errno_str(("bind " + endpoint_.to_string()).c_str());
      ::close(listen_fd_);
      listen_fd_ = -1;
      throw TransportError(msg);
    }
    break;
  }

  case EndpointKind::Tcp: {
    std::string err;
    addrinfo *res = resolve_tcp(endpoint_, true, err);
    if (!res) {
      throw TransportError(err);
    }
    for (addrinfo *ai = res; ai != nullptr; ai = ai->ai_next) {
      listen_fd_ = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
      if (listen_fd_ < 0) {
        continue;
      }
      int yes = 1;
      ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
      if (::bind(listen_fd_, ai->ai_addr, ai->ai_addrlen) == 0) {
        break;
      }
      err = errno_str(("bind " + endpoint_.to_string()).c_str());
      ::close(listen_fd_);
      listen_fd_ = -1;
    }
    ::freeaddrinfo(res);
    if (listen_fd_ < 0) {
      throw TransportError(err.empty() ? "bind " + endpoint_.to_string() +
                                             ": no usable address"
                                       : err);
    }
    break;
  }

  case EndpointKind::Fifo: {
    struct stat st {};
    if (::stat(endpoint_.path.c_str(), &st) == 0) {
      if (!S_ISFIFO(st.st_mode)) {
        throw TransportError(endpoint_.path + " exists and is not a FIFO");
      }
    } else if (::mkfifo(endpoint_.path.c_str(), 0600) < 0) {
      throw TransportError(errno_str(("mkfifo " + endpoint_.path).c_str()));
    }
    return;
  }
  }

  if (::listen(listen_fd_, 4) < 0) {
    const std::string msg = errno_str("listen");
    ::close(listen_fd_);
    listen_fd_ = -1;
    throw TransportError(msg);
  }
}

StreamListener::~StreamListener() {
  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
  }
  if (fifo_fd_ >= 0) {
    ::close(fifo_fd_);
  }
  if (endpoint_.kind == EndpointKind::Unix) {
    ::unlink(endpoint_.path.c_str());
  }
}

std::unique_ptr<ByteStream>
StreamListener::accept(std::chrono::milliseconds wait) {
  if (endpoint_.kind == EndpointKind::Fifo) {
    return accept_fifo(wait);
  }
  return accept_socket(wait);
}

std::unique_ptr<ByteStream>
StreamListener::accept_socket(std::chrono::milliseconds wait) {
  pollfd pfd{};
  pfd.fd = listen_fd_;
  pfd.events = POLLIN;
  const int pr = ::poll(&pfd, 1, static_cast<int>(wait.count()));
  if (pr < 0) {
    if (errno == EINTR) {
      return nullptr;
    }
    throw TransportError(errno_str("poll listener"));
  }
  if (pr == 0) {
    return nullptr;
  }

  const int fd = ::accept(listen_fd_, nullptr, nullptr);
  if (fd < 0) {
    if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) {
      return nullptr;
    }
    throw TransportError(errno_str("accept"));
  }
  if (endpoint_.kind == EndpointKind::Tcp) {
    int yes = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &yes, sizeof(yes));
  }
  return std::make_unique<FdStream>(fd, true, endpoint_.to_string(),
                                    idle_timeout_);
}

// A FIFO has no accept(). The read end is held open non-blocking and handed
// out once the first bytes from a writer are pending; a writer that came and
// went without sending anything leaves POLLHUP behind, so the end is reopened.
std::unique_ptr<ByteStream>
StreamListener::accept_fifo(std::chrono::milliseconds wait) {
  if (fifo_fd_ < 0) {
    fifo_fd_ = ::open(endpoint_.path.c_str(), O_RDONLY | O_NONBLOCK);
    if (fifo_fd_ < 0) {
      throw TransportError(errno_str(("open " + endpoint_.path).c_str()));
    }
  }

  pollfd pfd{};
  pfd.fd = fifo_fd_;
  pfd.events = POLLIN;
  const int pr = ::poll(&pfd, 1, static_cast<int>(wait.count()));
  if (pr < 0) {
    if (errno == EINTR) {
      return nullptr;
    }
    throw TransportError(errno_str("poll fifo"));
  }
  if (pr == 0) {
    return nullptr;
  }

  if (!(pfd.revents & POLLIN)) {
    ::close(fifo_fd_);
    fifo_fd_ = -1;
    return nullptr;
  }

  const int fd = fifo_fd_;
  fifo_fd_ = -1;
  return std::make_unique<FdStream>(fd, false, endpoint_.to_string(),
                                    idle_timeout_);
}

} // namespace transport
