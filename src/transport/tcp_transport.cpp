#include "qline/transport/tcp_transport.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "qline/utils/time.hpp"

#include <spdlog/spdlog.h>

namespace qline::transport {

namespace {

void log_errno(int error_code, const char* context) {
    spdlog::debug("{}: {}", context, std::strerror(error_code));
}

bool resolve(const SocketAddress& address, sockaddr_in& addr) {
    addr = {};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(address.port);

    if (address.host.empty() || address.host == "0.0.0.0") {
        addr.sin_addr.s_addr = INADDR_ANY;
        return true;
    }
    if (inet_pton(AF_INET, address.host.c_str(), &addr.sin_addr) > 0) {
        return true;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    int rc = getaddrinfo(address.host.c_str(), nullptr, &hints, &result);
    if (rc != 0 || result == nullptr) {
        spdlog::debug("getaddrinfo({}): {}", address.host, gai_strerror(rc));
        return false;
    }
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(result->ai_addr)->sin_addr;
    freeaddrinfo(result);
    return true;
}

SocketAddress to_address(const sockaddr_in& addr) {
    char ip_str[INET_ADDRSTRLEN];
    inet_ntop(AF_INET, &addr.sin_addr, ip_str, sizeof(ip_str));
    return SocketAddress{ip_str, ntohs(addr.sin_port)};
}

bool set_nonblocking(int fd, bool enabled) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    flags = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return fcntl(fd, F_SETFL, flags) == 0;
}

// poll() one descriptor; returns >0 ready, 0 timeout, <0 error
int wait_for(int fd, short events, std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    for (;;) {
        int rc = poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc < 0 && errno == EINTR) {
            continue;
        }
        return rc;
    }
}

}  // namespace

std::string SocketAddress::to_string() const {
    return host + ":" + std::to_string(port);
}

TcpStream::TcpStream(int fd, SocketAddress peer) : fd_(fd), peer_(std::move(peer)) {
    int optval = 1;
    if (setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof(optval)) < 0) {
        log_errno(errno, "setsockopt(TCP_NODELAY)");
    }
}

TcpStream::~TcpStream() {
    close();
}

bool TcpStream::write_all(std::span<const uint8_t> data) {
    if (fd_ < 0) {
        return false;
    }

    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            log_errno(errno, "send()");
            return false;
        }
        sent += static_cast<size_t>(n);
    }
    bytes_sent_ += sent;
    return true;
}

ReadResult TcpStream::read_some(std::span<uint8_t> out, std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return {ReadStatus::CLOSED, 0};
    }

    utils::Deadline deadline(timeout);
    for (;;) {
        int ready = wait_for(fd_, POLLIN, deadline.remaining());
        if (ready == 0) {
            return {ReadStatus::TIMEOUT, 0};
        }
        if (ready < 0) {
            log_errno(errno, "poll()");
            return {ReadStatus::ERROR, 0};
        }

        ssize_t n = ::recv(fd_, out.data(), out.size(), 0);
        if (n == 0) {
            return {ReadStatus::CLOSED, 0};
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            log_errno(errno, "recv()");
            return {ReadStatus::ERROR, 0};
        }
        bytes_received_ += static_cast<uint64_t>(n);
        return {ReadStatus::OK, static_cast<size_t>(n)};
    }
}

void TcpStream::close() {
    if (fd_ >= 0) {
        ::shutdown(fd_, SHUT_RDWR);
        ::close(fd_);
        fd_ = -1;
    }
}

TcpListener::~TcpListener() {
    close();
}

bool TcpListener::open(const SocketAddress& bind_address, int backlog) {
    sockaddr_in addr{};
    if (!resolve(bind_address, addr)) {
        return false;
    }

    fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
        log_errno(errno, "socket()");
        return false;
    }

    int optval = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval)) < 0) {
        log_errno(errno, "setsockopt(SO_REUSEADDR)");
    }

    if (bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        log_errno(errno, "bind()");
        close();
        return false;
    }
    if (listen(fd_, backlog) < 0) {
        log_errno(errno, "listen()");
        close();
        return false;
    }

    // Get actual bound address
    socklen_t addr_len = sizeof(addr);
    if (getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &addr_len) == 0) {
        local_addr_ = to_address(addr);
    }
    return true;
}

std::unique_ptr<TcpStream> TcpListener::accept(std::chrono::milliseconds timeout) {
    if (fd_ < 0) {
        return nullptr;
    }

    int ready = wait_for(fd_, POLLIN, timeout);
    if (ready <= 0) {
        if (ready < 0) {
            log_errno(errno, "poll()");
        }
        return nullptr;
    }

    sockaddr_in peer{};
    socklen_t peer_len = sizeof(peer);
    int client = ::accept(fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
    if (client < 0) {
        log_errno(errno, "accept()");
        return nullptr;
    }
    return std::make_unique<TcpStream>(client, to_address(peer));
}

void TcpListener::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::unique_ptr<TcpStream> tcp_connect(const SocketAddress& address, std::chrono::milliseconds timeout) {
    sockaddr_in addr{};
    if (!resolve(address, addr)) {
        return nullptr;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        log_errno(errno, "socket()");
        return nullptr;
    }

    // Non-blocking connect so the timeout applies
    if (!set_nonblocking(fd, true)) {
        log_errno(errno, "fcntl(O_NONBLOCK)");
        ::close(fd);
        return nullptr;
    }

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc < 0 && errno != EINPROGRESS) {
        log_errno(errno, "connect()");
        ::close(fd);
        return nullptr;
    }
    if (rc < 0) {
        int ready = wait_for(fd, POLLOUT, timeout);
        if (ready <= 0) {
            spdlog::debug("connect() to {} timed out", address.to_string());
            ::close(fd);
            return nullptr;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
            log_errno(so_error != 0 ? so_error : errno, "connect()");
            ::close(fd);
            return nullptr;
        }
    }

    if (!set_nonblocking(fd, false)) {
        log_errno(errno, "fcntl(~O_NONBLOCK)");
        ::close(fd);
        return nullptr;
    }
    return std::make_unique<TcpStream>(fd, to_address(addr));
}

}  // namespace qline::transport
