#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "byte_stream.hpp"

namespace qline::transport {

// Socket address (IPv4)
struct SocketAddress {
    std::string host;
    uint16_t port{0};

    std::string to_string() const;
};

// Connected TCP stream. Reads wait with poll() so every call honours its
// timeout; writes block until the kernel takes every byte.
class TcpStream : public ByteStream {
public:
    explicit TcpStream(int fd, SocketAddress peer = {});
    ~TcpStream() override;

    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    bool write_all(std::span<const uint8_t> data) override;
    ReadResult read_some(std::span<uint8_t> out, std::chrono::milliseconds timeout) override;
    void close() override;
    [[nodiscard]] bool is_open() const override { return fd_ >= 0; }

    [[nodiscard]] const SocketAddress& peer() const { return peer_; }
    [[nodiscard]] uint64_t bytes_sent() const { return bytes_sent_; }
    [[nodiscard]] uint64_t bytes_received() const { return bytes_received_; }

private:
    int fd_{-1};
    SocketAddress peer_;
    uint64_t bytes_sent_{0};
    uint64_t bytes_received_{0};
};

class TcpListener {
public:
    TcpListener() = default;
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Bind and listen. Port 0 picks an ephemeral port; see local_address().
    bool open(const SocketAddress& bind_address, int backlog = 4);

    // Wait up to timeout for one connection; nullptr on timeout or error
    std::unique_ptr<TcpStream> accept(std::chrono::milliseconds timeout);

    void close();

    [[nodiscard]] bool is_open() const { return fd_ >= 0; }
    [[nodiscard]] const SocketAddress& local_address() const { return local_addr_; }

private:
    int fd_{-1};
    SocketAddress local_addr_;
};

// Connect to host:port within timeout; nullptr on failure
std::unique_ptr<TcpStream> tcp_connect(const SocketAddress& address, std::chrono::milliseconds timeout);

}  // namespace qline::transport
