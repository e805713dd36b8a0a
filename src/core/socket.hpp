// Prism Socket Utilities - Header

#pragma once

#include <sys/socket.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace prism::core {

using Clock = std::chrono::steady_clock;
using Deadline = Clock::time_point;

/// Deadline `timeout` from now
[[nodiscard]] inline Deadline deadline_after(std::chrono::milliseconds timeout) {
    return Clock::now() + timeout;
}

/// Milliseconds left until `deadline` (0 when expired)
[[nodiscard]] int remaining_ms(Deadline deadline) noexcept;

/// Create non-blocking listening TCP socket
[[nodiscard]] int create_listening_socket(
    std::string_view address,
    uint16_t port,
    int backlog = 128);

/// Create non-blocking UDP socket bound to address:port (SO_REUSEPORT so
/// per-peer sockets can share the port)
[[nodiscard]] int create_datagram_socket(std::string_view address, uint16_t port);

/// Resolve host:port to a socket address (numeric or DNS via getaddrinfo)
[[nodiscard]] std::error_code resolve_address(
    std::string_view host,
    uint16_t port,
    int socktype,
    sockaddr_storage& out,
    socklen_t& out_len);

/// Connect to host:port, giving up at `deadline`. On success `out_fd` is a
/// non-blocking connected socket owned by the caller.
[[nodiscard]] std::error_code connect_with_deadline(
    std::string_view host,
    uint16_t port,
    int socktype,
    Deadline deadline,
    int& out_fd);

/// Wait until fd is readable/writable (poll events) or the deadline passes.
/// Returns std::errc::timed_out on expiry.
[[nodiscard]] std::error_code wait_for(int fd, short events, Deadline deadline);

/// Write the whole buffer before the deadline
[[nodiscard]] std::error_code write_all(int fd, std::span<const uint8_t> data, Deadline deadline);

/// Read whatever is available (at least one byte) before the deadline.
/// End of stream reports GatewayErrc::connection_closed.
[[nodiscard]] std::error_code read_some(
    int fd,
    std::span<uint8_t> buffer,
    Deadline deadline,
    size_t& bytes_read);

[[nodiscard]] std::error_code set_nonblocking(int fd);
[[nodiscard]] std::error_code set_reuseaddr(int fd);
[[nodiscard]] std::error_code set_nodelay(int fd);

/// Local port a socket is bound to (0 on failure)
[[nodiscard]] uint16_t local_port(int fd) noexcept;

/// "host:port" rendering of a socket address
[[nodiscard]] std::string format_address(const sockaddr_storage& addr, socklen_t len);

/// Wake any thread blocked on fd without releasing the descriptor
void shutdown_socket(int fd) noexcept;

void close_fd(int fd) noexcept;

} // namespace prism::core
