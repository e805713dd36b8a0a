/*
 * Copyright 2025 Prism Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Prism Socket Utilities - Implementation

#include "socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#include "errors.hpp"

namespace prism::core {

namespace {

std::error_code last_error() {
    return std::error_code(errno, std::system_category());
}

// Bind helper shared by stream and datagram sockets
int bind_socket(int type, std::string_view address, uint16_t port, bool reuse_port) {
    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    if (resolve_address(address, port, type, addr, addr_len)) {
        return -1;
    }

    int fd = socket(addr.ss_family, type, 0);
    if (fd < 0) {
        return -1;
    }

    // SO_REUSEADDR - allows binding to same address immediately after restart
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        close_fd(fd);
        return -1;
    }

#ifdef SO_REUSEPORT
    if (reuse_port && setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0) {
        close_fd(fd);
        return -1;
    }
#endif

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), addr_len) < 0) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

}  // namespace

int remaining_ms(Deadline deadline) noexcept {
    auto now = Clock::now();
    if (now >= deadline) {
        return 0;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    // Round up so a sub-millisecond remainder still polls once
    left = std::max<int64_t>(left, 1);
    return static_cast<int>(std::min<int64_t>(left, std::numeric_limits<int>::max()));
}

int create_listening_socket(std::string_view address, uint16_t port, int backlog) {
    int fd = bind_socket(SOCK_STREAM, address, port, false);
    if (fd < 0) {
        return -1;
    }

    if (listen(fd, backlog) < 0) {
        close_fd(fd);
        return -1;
    }

    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

int create_datagram_socket(std::string_view address, uint16_t port) {
    int fd = bind_socket(SOCK_DGRAM, address, port, true);
    if (fd < 0) {
        return -1;
    }

    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return -1;
    }

    return fd;
}

std::error_code resolve_address(std::string_view host, uint16_t port, int socktype,
                                sockaddr_storage& out, socklen_t& out_len) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = socktype;
    hints.ai_flags = AI_ADDRCONFIG | AI_NUMERICSERV;

    std::string host_str{host.empty() ? std::string_view{"0.0.0.0"} : host};
    std::string port_str = std::to_string(port);

    addrinfo* result = nullptr;
    int rc = getaddrinfo(host_str.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || result == nullptr) {
        return std::make_error_code(std::errc::host_unreachable);
    }

    std::memcpy(&out, result->ai_addr, result->ai_addrlen);
    out_len = static_cast<socklen_t>(result->ai_addrlen);
    freeaddrinfo(result);
    return {};
}

std::error_code connect_with_deadline(std::string_view host, uint16_t port, int socktype,
                                      Deadline deadline, int& out_fd) {
    out_fd = -1;

    sockaddr_storage addr{};
    socklen_t addr_len = 0;
    if (auto ec = resolve_address(host, port, socktype, addr, addr_len); ec) {
        return ec;
    }

    int fd = socket(addr.ss_family, socktype, 0);
    if (fd < 0) {
        return last_error();
    }

    if (auto ec = set_nonblocking(fd); ec) {
        close_fd(fd);
        return ec;
    }

    if (connect(fd, reinterpret_cast<sockaddr*>(&addr), addr_len) < 0) {
        if (errno != EINPROGRESS) {
            auto ec = last_error();
            close_fd(fd);
            return ec;
        }

        if (auto ec = wait_for(fd, POLLOUT, deadline); ec) {
            close_fd(fd);
            return ec;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
            auto ec = last_error();
            close_fd(fd);
            return ec;
        }
        if (so_error != 0) {
            close_fd(fd);
            return std::error_code(so_error, std::system_category());
        }
    }

    out_fd = fd;
    return {};
}

std::error_code wait_for(int fd, short events, Deadline deadline) {
    while (true) {
        int timeout = remaining_ms(deadline);
        if (timeout == 0) {
            return std::make_error_code(std::errc::timed_out);
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int rc = poll(&pfd, 1, timeout);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return last_error();
        }
        if (rc == 0) {
            continue;  // Loop re-checks the deadline
        }
        if (pfd.revents & POLLNVAL) {
            return std::make_error_code(std::errc::bad_file_descriptor);
        }
        // POLLERR/POLLHUP are reported to the caller by the following read/write
        return {};
    }
}

std::error_code write_all(int fd, std::span<const uint8_t> data, Deadline deadline) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::send(fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (n > 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            if (auto ec = wait_for(fd, POLLOUT, deadline); ec) {
                return ec;
            }
            continue;
        }
        return n < 0 ? last_error() : std::make_error_code(std::errc::io_error);
    }
    return {};
}

std::error_code read_some(int fd, std::span<uint8_t> buffer, Deadline deadline,
                          size_t& bytes_read) {
    bytes_read = 0;
    while (true) {
        ssize_t n = ::recv(fd, buffer.data(), buffer.size(), 0);
        if (n > 0) {
            bytes_read = static_cast<size_t>(n);
            return {};
        }
        if (n == 0) {
            return make_error_code(GatewayErrc::connection_closed);
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            if (auto ec = wait_for(fd, POLLIN, deadline); ec) {
                return ec;
            }
            continue;
        }
        return last_error();
    }
}

std::error_code set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return last_error();
    }

    if (fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        return last_error();
    }

    return {};
}

std::error_code set_reuseaddr(int fd) {
    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

std::error_code set_nodelay(int fd) {
    int opt = 1;
    if (setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &opt, sizeof(opt)) < 0) {
        return last_error();
    }
    return {};
}

uint16_t local_port(int fd) noexcept {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    if (addr.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
    }
    if (addr.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
    }
    return 0;
}

std::string format_address(const sockaddr_storage& addr, socklen_t /*len*/) {
    char host[INET6_ADDRSTRLEN] = {};
    uint16_t port = 0;

    if (addr.ss_family == AF_INET) {
        const auto* in4 = reinterpret_cast<const sockaddr_in*>(&addr);
        inet_ntop(AF_INET, &in4->sin_addr, host, sizeof(host));
        port = ntohs(in4->sin_port);
    } else if (addr.ss_family == AF_INET6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
        inet_ntop(AF_INET6, &in6->sin6_addr, host, sizeof(host));
        port = ntohs(in6->sin6_port);
    } else {
        return "unknown";
    }

    return std::string(host) + ":" + std::to_string(port);
}

void shutdown_socket(int fd) noexcept {
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void close_fd(int fd) noexcept {
    if (fd >= 0) {
        close(fd);
    }
}

}  // namespace prism::core
