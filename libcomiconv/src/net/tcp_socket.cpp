#include "../../include/tcp_socket.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <stdexcept>

namespace comiconv {

namespace {

std::string errno_str(const int err) {
    return std::strerror(err);
}

} // namespace

ServerAddress parse_server_address(const std::string& text) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
        throw std::invalid_argument("expected HOST:PORT, got '" + text + "'");
    }
    ServerAddress addr;
    addr.host = text.substr(0, colon);
    // [::1]:9000
    if (addr.host.size() > 2 && addr.host.front() == '[' && addr.host.back() == ']') {
        addr.host = addr.host.substr(1, addr.host.size() - 2);
    }

    const char* first = text.data() + colon + 1;
    const char* last = text.data() + text.size();
    unsigned value = 0;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value == 0 || value > 65535) {
        throw std::invalid_argument("invalid port in '" + text + "'");
    }
    addr.port = static_cast<std::uint16_t>(value);
    return addr;
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = -1;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

void TcpSocket::connect(const std::string& host, const std::uint16_t port) {
    close();

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* res = nullptr;
    const std::string service = std::to_string(port);
    if (const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &res); rc != 0) {
        throw IoError("cannot resolve " + host + ": " + ::gai_strerror(rc));
    }

    int last_err = 0;
    for (const addrinfo* ai = res; ai; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_err = errno;
            continue;
        }
        if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            fd_ = fd;
            break;
        }
        last_err = errno;
        ::close(fd);
    }
    ::freeaddrinfo(res);

    if (fd_ < 0) {
        throw IoError("connect to " + host + ":" + service + " failed: " + errno_str(last_err));
    }
    tune();
    Logger::log(LogLevel::Debug, "Connected to " + peer_addr(), "tcp_socket");
}

void TcpSocket::send_all(std::span<const std::uint8_t> data) {
    const auto* p = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw IoError("send() failed: " + errno_str(errno));
        }
        if (sent == 0) {
            throw IoError("connection closed during send");
        }
        p += sent;
        remaining -= static_cast<std::size_t>(sent);
    }
}

bool TcpSocket::recv_all(std::span<std::uint8_t> out) {
    auto* p = out.data();
    std::size_t remaining = out.size();
    while (remaining > 0) {
        const ssize_t received = ::recv(fd_, p, remaining, 0);
        if (received == 0) return false; // clean close
        if (received < 0) {
            const int err = errno;
            if (err == EINTR) continue;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                // SO_RCVTIMEO expired
                return false;
            }
            if (err == ECONNRESET) return false;
            throw IoError("recv() failed: " + errno_str(err));
        }
        p += received;
        remaining -= static_cast<std::size_t>(received);
    }
    return true;
}

void TcpSocket::set_recv_timeout_ms(const int ms) {
    timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
        throw IoError("setsockopt(SO_RCVTIMEO) failed: " + errno_str(errno));
    }
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    ::setsockopt(fd_, SOL_SOCKET, SO_KEEPALIVE, &keepalive, sizeof(keepalive));
}

void TcpSocket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&peer), &len) != 0) {
        return "unknown";
    }
    char buf[INET6_ADDRSTRLEN] = {0};
    if (peer.ss_family == AF_INET6) {
        const auto* a = reinterpret_cast<const sockaddr_in6*>(&peer);
        if (::inet_ntop(AF_INET6, &a->sin6_addr, buf, sizeof(buf))) {
            return "[" + std::string(buf) + "]:" + std::to_string(ntohs(a->sin6_port));
        }
    } else {
        const auto* a = reinterpret_cast<const sockaddr_in*>(&peer);
        if (::inet_ntop(AF_INET, &a->sin_addr, buf, sizeof(buf))) {
            return std::string(buf) + ":" + std::to_string(ntohs(a->sin_port));
        }
    }
    return "unknown";
}

} // namespace comiconv
